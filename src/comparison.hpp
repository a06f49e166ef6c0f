#ifndef COMPARISON_HPP
#define COMPARISON_HPP
#include "config.hpp"
#include "reporter.hpp"

struct ComparisonResult
{
    std::uint32_t seed;
    std::vector<RunResult> runs;
    std::vector<PolicySummary> summaries;
    std::vector<CumulativeTotals> totals;
};

// Runs every configured policy over the same arm set, one after the other,
// then hands the reward sequences to the reporter. An empty output path
// skips that file.
ComparisonResult comparison(const ComparisonConfig &config, std::shared_ptr<spdlog::logger> logger);
#endif
