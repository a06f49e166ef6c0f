#include "experiment.hpp"
#include "errors.hpp"
#include <boost/random/bernoulli_distribution.hpp>
#include <fmt/format.h>

RewardModel parse_reward_model(const std::string &name)
{
    if (name == "true-mean")
    {
        return RewardModel::TRUE_MEAN;
    }
    if (name == "bernoulli")
    {
        return RewardModel::BERNOULLI;
    }
    throw InvalidConfiguration("unknown reward model '" + name + "', expected true-mean or bernoulli");
}

std::string to_string(RewardModel model)
{
    switch (model)
    {
    case RewardModel::BERNOULLI:
        return "bernoulli";
    default:
        return "true-mean";
    }
}

double ExperimentRunner::observe(const Policy &policy, ui arm)
{
    if (arm >= policy.arms())
    {
        throw InvalidArmIndex(fmt::format("policy picked arm {} outside [0, {})", arm, policy.arms()));
    }
    double mean = policy.true_means[arm];
    if (model == RewardModel::TRUE_MEAN)
    {
        return mean;
    }
    boost::random::bernoulli_distribution<double> pull(mean);
    return pull(rng) ? 1.0 : 0.0;
}

vector<double> ExperimentRunner::run(Policy &policy, int num_trials)
{
    require(num_trials > 0, fmt::format("num_trials must be positive, got {}", num_trials));
    if (model == RewardModel::BERNOULLI)
    {
        for (auto mean : policy.true_means)
        {
            require(mean >= 0.0 && mean <= 1.0,
                    fmt::format("bernoulli rewards need true means in [0, 1], got {}", mean));
        }
    }

    vector<double> rewards;
    rewards.reserve(num_trials);
    for (int t = 0; t < num_trials; t++)
    {
        ui arm = policy.select();
        double reward = observe(policy, arm);
        policy.update(arm, reward);
        rewards.push_back(reward);
    }
    return rewards;
}

RunResult ExperimentRunner::run_named(Policy &policy, int num_trials)
{
    return RunResult{policy.name(), policy.label(), run(policy, num_trials)};
}
