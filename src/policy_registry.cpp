#include "policy_registry.hpp"
#include "epsilon_greedy_policy.hpp"
#include "errors.hpp"
#include "thompson_policy.hpp"
#include <algorithm>
#include <utility>

PolicyRegistry::PolicyRegistry()
{
    add("epsilon-greedy", [](const ArmSet &true_means, const PolicyOptions &options, std::uint32_t seed) -> PolicyPtr {
        return std::make_unique<EpsilonGreedyPolicy>(true_means, options.epsilon, seed);
    });
    add("thompson", [](const ArmSet &true_means, const PolicyOptions &, std::uint32_t seed) -> PolicyPtr {
        return std::make_unique<ThompsonSamplingPolicy>(true_means, seed);
    });
}

void PolicyRegistry::add(const std::string &name, PolicyFactory factory)
{
    factories.insert_or_assign(name, std::move(factory));
}

bool PolicyRegistry::contains(const std::string &name) const
{
    return factories.find(name) != factories.end();
}

PolicyPtr PolicyRegistry::create(const std::string &name, const ArmSet &true_means, const PolicyOptions &options, std::uint32_t seed) const
{
    auto it = factories.find(name);
    if (it == factories.end())
    {
        std::string known;
        for (auto &candidate : names())
        {
            known += known.empty() ? candidate : ", " + candidate;
        }
        throw InvalidConfiguration("unknown policy '" + name + "', known policies: " + known);
    }
    return it->second(true_means, options, seed);
}

std::vector<std::string> PolicyRegistry::names() const
{
    std::vector<std::string> result;
    result.reserve(factories.size());
    for (auto &[name, factory] : factories)
    {
        result.push_back(name);
    }
    std::sort(result.begin(), result.end());
    return result;
}
