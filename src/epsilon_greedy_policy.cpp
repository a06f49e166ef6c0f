#include "epsilon_greedy_policy.hpp"
#include "errors.hpp"
#include <boost/random/uniform_01.hpp>
#include <boost/random/uniform_int_distribution.hpp>
#include <fmt/format.h>
#include <numeric>

EpsilonGreedyPolicy::EpsilonGreedyPolicy(const ArmSet &_true_means, const double _epsilon, std::uint32_t seed)
    : Policy(_true_means, seed), epsilon(_epsilon), action_values(_true_means.size(), 0.0)
{
    require(epsilon >= 0.0 && epsilon <= 1.0,
            fmt::format("epsilon must lie in [0, 1], got {}", epsilon));
}

ui EpsilonGreedyPolicy::select()
{
    boost::random::uniform_01<double> coin;
    if (coin(rng) < epsilon)
    {
        boost::random::uniform_int_distribution<ui> any_arm(0, arms() - 1);
        return any_arm(rng);
    }
    return static_cast<ui>(argmax_first(action_values));
}

void EpsilonGreedyPolicy::update(ui arm, double reward)
{
    ui n = record(arm, reward);
    action_values[arm] += (reward - action_values[arm]) / n;
}

PolicySummary EpsilonGreedyPolicy::report() const
{
    // plain mean over arms, untried arms contribute 0
    double avg_reward = std::accumulate(action_values.begin(), action_values.end(), 0.0) / action_values.size();
    return PolicySummary{name(), avg_reward, best_mean(true_means) - avg_reward};
}

std::string EpsilonGreedyPolicy::describe() const
{
    return fmt::format("EpsilonGreedy Bandit with epsilon={}", epsilon);
}
