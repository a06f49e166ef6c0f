#include "comparison.hpp"
#include "policy_registry.hpp"
#include <fmt/format.h>
#include <fmt/ranges.h>

ComparisonResult comparison(const ComparisonConfig &config, std::shared_ptr<spdlog::logger> logger)
{
    config.validate();

    ComparisonResult result;
    result.seed = resolve_seed(config.seed);
    logger->info("arms {} trials {} epsilon {} rewards {} seed {}",
                 fmt::format("{}", fmt::join(config.true_means, ",")), config.num_trials,
                 config.epsilon, to_string(config.reward_model), result.seed);

    PolicyRegistry registry;
    PolicyOptions options{config.epsilon};
    for (ui k = 0; k < config.policies.size(); k++)
    {
        // distinct streams per policy, all derived from the one seed
        std::uint32_t policy_seed = result.seed + 2 * k;
        std::uint32_t reward_seed = result.seed + 2 * k + 1;

        auto policy = registry.create(config.policies[k], config.true_means, options, policy_seed);
        logger->debug("running {}", policy->describe());
        ExperimentRunner runner(config.reward_model, reward_seed);
        result.runs.push_back(runner.run_named(*policy, config.num_trials));

        auto summary = policy->report();
        logger->info("{}", summary.str());
        result.summaries.push_back(summary);
    }

    Reporter reporter(config.true_means, logger);
    if (!config.rewards_path.empty())
    {
        reporter.store_rewards_csv(config.rewards_path, result.runs);
    }
    if (!config.curves_path.empty())
    {
        reporter.store_curves(config.curves_path, result.runs);
        if (!config.plot_path.empty())
        {
            reporter.store_plot_script(config.plot_path, config.curves_path, result.runs);
        }
    }
    result.totals = reporter.report_cumulative_reward_and_regret(result.runs);
    return result;
}
