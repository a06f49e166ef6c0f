#ifndef REPORTER_HPP
#define REPORTER_HPP
#include "experiment.hpp"
#include <memory>
#include <spdlog/spdlog.h>
#include <string>

struct CumulativeTotals
{
    std::string algorithm;
    double reward;
    double regret;
};

vector<double> cumulative_rewards(const vector<double> &rewards);
// max(true_means) * n - sum(rewards)
double cumulative_regret(const ArmSet &true_means, const vector<double> &rewards);

// Turns the reward sequences of a comparison into totals, a persisted table
// and plot data. All writers overwrite their target and throw ReportError.
struct Reporter
{
    ArmSet true_means;
    std::shared_ptr<spdlog::logger> logger;

    Reporter(const ArmSet &_true_means, std::shared_ptr<spdlog::logger> _logger);

    // Header Bandit,Reward,Algorithm then one row per trial per run.
    void store_rewards_csv(const std::string &path, const std::vector<RunResult> &runs) const;
    // Trial, then the cumulative reward and its natural log for every run.
    void store_curves(const std::string &path, const std::vector<RunResult> &runs) const;
    // gnuplot script drawing the two panels from a curves file.
    void store_plot_script(const std::string &path, const std::string &curves_path, const std::vector<RunResult> &runs) const;

    std::vector<CumulativeTotals> report_cumulative_reward_and_regret(const std::vector<RunResult> &runs) const;
};
#endif
