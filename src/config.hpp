#ifndef CONFIG_HPP
#define CONFIG_HPP
#include "bandit.hpp"
#include "experiment.hpp"
#include <string>

constexpr int kDefaultTrials = 20000;

struct ComparisonConfig
{
    ArmSet true_means{1, 2, 3, 4};
    double epsilon = 0.2;
    int num_trials = kDefaultTrials;
    std::vector<std::string> policies{"epsilon-greedy", "thompson"};
    RewardModel reward_model = RewardModel::TRUE_MEAN;
    std::uint32_t seed = 0;
    std::string rewards_path = "bandit_rewards.csv";
    std::string curves_path = "bandit_curves.csv";
    std::string plot_path = "bandit_plots.gp";

    // Throws InvalidConfiguration on the first bad field.
    void validate() const;
};

// "1,2.5,3" -> {1, 2.5, 3}. Blank entries and trailing garbage are rejected.
ArmSet parse_means(const std::string &text);
std::vector<std::string> split_names(const std::string &text);
#endif
