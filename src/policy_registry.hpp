#ifndef POLICY_REGISTRY_HPP
#define POLICY_REGISTRY_HPP
#include "policy.hpp"
#include <ankerl/unordered_dense.h>
#include <functional>
#include <string>

struct PolicyOptions
{
    double epsilon;
};

using PolicyFactory = std::function<PolicyPtr(const ArmSet &, const PolicyOptions &, std::uint32_t)>;

// Builds policies by the names accepted on the command line.
struct PolicyRegistry
{
    ankerl::unordered_dense::map<std::string, PolicyFactory> factories;

    PolicyRegistry();
    void add(const std::string &name, PolicyFactory factory);
    bool contains(const std::string &name) const;
    PolicyPtr create(const std::string &name, const ArmSet &true_means, const PolicyOptions &options, std::uint32_t seed) const;
    std::vector<std::string> names() const;
};
#endif
