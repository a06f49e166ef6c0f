#ifndef EXPERIMENT_HPP
#define EXPERIMENT_HPP
#include "policy.hpp"
#include <boost/random/mersenne_twister.hpp>
#include <string>

enum class RewardModel
{
    TRUE_MEAN = 0, // observed reward is the arm's true mean
    BERNOULLI      // 1 with probability true mean, else 0
};

RewardModel parse_reward_model(const std::string &name);
std::string to_string(RewardModel model);

// Reward sequence of one policy run, in the shape the reporter consumes.
struct RunResult
{
    std::string bandit;
    std::string algorithm;
    vector<double> rewards;
};

struct ExperimentRunner
{
    RewardModel model;
    boost::random::mt19937 rng;

    ExperimentRunner(RewardModel _model = RewardModel::TRUE_MEAN, std::uint32_t seed = 1) : model(_model), rng(seed) {}

    // One select/observe/update cycle per trial, in order. Returns exactly
    // num_trials rewards.
    vector<double> run(Policy &policy, int num_trials);
    RunResult run_named(Policy &policy, int num_trials);

    double observe(const Policy &policy, ui arm);
};
#endif
