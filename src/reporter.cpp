#include "reporter.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fmt/format.h>
#include <fstream>
#include <numeric>

namespace
{
std::ofstream open_for_write(const std::string &path)
{
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open())
    {
        throw ReportError("Failed to open file: " + path);
    }
    return out;
}

void finish(std::ofstream &out, const std::string &path)
{
    out.flush();
    if (!out)
    {
        throw ReportError("Failed to write file: " + path);
    }
}

// gnuplot wants embedded double quotes escaped
std::string quoted(const std::string &s)
{
    std::string result = "\"";
    for (char c : s)
    {
        if (c == '"' || c == '\\')
            result += '\\';
        result += c;
    }
    return result + "\"";
}
} // namespace

vector<double> cumulative_rewards(const vector<double> &rewards)
{
    vector<double> result(rewards.size());
    std::partial_sum(rewards.begin(), rewards.end(), result.begin());
    return result;
}

double cumulative_regret(const ArmSet &true_means, const vector<double> &rewards)
{
    double total = std::accumulate(rewards.begin(), rewards.end(), 0.0);
    return best_mean(true_means) * rewards.size() - total;
}

Reporter::Reporter(const ArmSet &_true_means, std::shared_ptr<spdlog::logger> _logger)
    : true_means(_true_means), logger(std::move(_logger))
{
    require(!true_means.empty(), "reporter needs at least one arm");
}

void Reporter::store_rewards_csv(const std::string &path, const std::vector<RunResult> &runs) const
{
    auto out = open_for_write(path);
    out << "Bandit,Reward,Algorithm\n";
    for (auto &run : runs)
    {
        for (auto reward : run.rewards)
        {
            out << run.bandit << ',' << fmt::format("{}", reward) << ',' << run.algorithm << '\n';
        }
    }
    finish(out, path);
    logger->debug("wrote {} runs to {}", runs.size(), path);
}

void Reporter::store_curves(const std::string &path, const std::vector<RunResult> &runs) const
{
    std::vector<vector<double>> curves;
    std::size_t length = 0;
    for (auto &run : runs)
    {
        curves.push_back(cumulative_rewards(run.rewards));
        length = std::max(length, run.rewards.size());
    }

    auto out = open_for_write(path);
    out << "Trial";
    for (auto &run : runs)
    {
        out << ',' << run.algorithm << ',' << run.algorithm << " (log scale)";
    }
    out << '\n';
    for (std::size_t t = 0; t < length; t++)
    {
        out << t + 1;
        for (auto &curve : curves)
        {
            if (t >= curve.size())
            {
                out << ",,";
                continue;
            }
            double value = curve[t];
            std::string log_value = value > 0.0 ? fmt::format("{}", std::log(value)) : "nan";
            out << ',' << fmt::format("{}", value) << ',' << log_value;
        }
        out << '\n';
    }
    finish(out, path);
    logger->debug("wrote {} curve points to {}", length, path);
}

void Reporter::store_plot_script(const std::string &path, const std::string &curves_path, const std::vector<RunResult> &runs) const
{
    auto out = open_for_write(path);
    out << "set datafile separator ','\n";
    out << "set key autotitle columnhead\n";
    out << "set terminal pngcairo size 1200,600\n";
    auto image = std::filesystem::path(path).replace_extension(".png").string();
    out << "set output " << quoted(image) << "\n";
    out << "set multiplot layout 1,2\n";

    auto panel = [&](const std::string &ylabel, std::size_t offset, const std::string &suffix) {
        out << "set xlabel \"Trials\"\n";
        out << "set ylabel " << quoted(ylabel) << "\n";
        out << "plot ";
        for (std::size_t k = 0; k < runs.size(); k++)
        {
            if (k != 0)
                out << ", \\\n     ";
            // column 1 is Trial, each run then owns two columns
            out << quoted(curves_path) << " using 1:" << 2 + 2 * k + offset
                << " with lines title " << quoted(runs[k].algorithm + suffix);
        }
        out << "\n";
    };
    panel("Cumulative Reward", 0, "");
    panel("Cumulative Reward (log scale)", 1, " (log scale)");
    out << "unset multiplot\n";
    finish(out, path);
}

std::vector<CumulativeTotals> Reporter::report_cumulative_reward_and_regret(const std::vector<RunResult> &runs) const
{
    std::vector<CumulativeTotals> totals;
    for (auto &run : runs)
    {
        double reward = std::accumulate(run.rewards.begin(), run.rewards.end(), 0.0);
        totals.push_back(CumulativeTotals{run.algorithm, reward, cumulative_regret(true_means, run.rewards)});
    }
    for (auto &total : totals)
    {
        logger->info("Cumulative Reward - {}: {}", total.algorithm, total.reward);
    }
    for (auto &total : totals)
    {
        logger->info("Cumulative Regret - {}: {}", total.algorithm, total.regret);
    }
    return totals;
}
