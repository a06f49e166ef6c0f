#ifndef EPSILON_GREEDY_POLICY_HPP
#define EPSILON_GREEDY_POLICY_HPP
#include "policy.hpp"

constexpr double kDefaultEpsilon = 0.2;

struct EpsilonGreedyPolicy : Policy
{
    const double epsilon;
    // running sample mean of the rewards seen per arm
    vector<double> action_values;

    EpsilonGreedyPolicy(const ArmSet &_true_means, double _epsilon = kDefaultEpsilon, std::uint32_t seed = 1);

    ui select() override;
    void update(ui arm, double reward) override;
    PolicySummary report() const override;
    std::string describe() const override;
    std::string name() const override { return "EpsilonGreedy"; }
    std::string label() const override { return "Epsilon-Greedy"; }
};
#endif
