#ifndef POLICY_HPP
#define POLICY_HPP
#include "bandit.hpp"
#include <boost/random/mersenne_twister.hpp>
#include <memory>
#include <string>

struct PolicySummary
{
    std::string name;
    double avg_reward;
    double avg_regret;
    std::string str() const;
    friend std::ostream &operator<<(std::ostream &os, const PolicySummary &summary)
    {
        return os << summary.str();
    }
};

// Common state and contract of an arm-selection policy. A policy is built for
// one run over a fixed arm set and owns its random engine.
struct Policy
{
    const ArmSet true_means;
    vector<double> estimated_means;
    vector<ui> action_counts;
    boost::random::mt19937 rng;

    Policy(const ArmSet &_true_means, std::uint32_t seed);
    virtual ~Policy() = default;

    // Pick the arm for the next trial. Never touches the statistics.
    virtual ui select() = 0;
    // Feed back the reward observed for arm. Throws InvalidArmIndex.
    virtual void update(ui arm, double reward) = 0;
    virtual PolicySummary report() const = 0;
    virtual std::string describe() const = 0;

    // Short name used as the "Bandit" column, e.g. EpsilonGreedy.
    virtual std::string name() const = 0;
    // Display label used as the "Algorithm" column, e.g. Epsilon-Greedy.
    virtual std::string label() const = 0;

    ui arms() const { return static_cast<ui>(true_means.size()); }

protected:
    void check_arm(ui arm) const;
    // Bumps action_counts and estimated_means for arm, returns the new count.
    ui record(ui arm, double reward);
};

using PolicyPtr = std::unique_ptr<Policy>;

// 0 asks for a seed from std::random_device.
std::uint32_t resolve_seed(std::uint32_t seed);
#endif
