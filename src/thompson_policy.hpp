#ifndef THOMPSON_POLICY_HPP
#define THOMPSON_POLICY_HPP
#include "policy.hpp"
#include <boost/random/beta_distribution.hpp>
#include <numeric>

// Beta-Bernoulli Thompson sampling. Only a reward of exactly 1 counts as a
// success; every other value, including non-binary rewards, is a failure.
struct ThompsonSamplingPolicy : Policy
{
    vector<ui> alpha;
    vector<ui> beta;

    ThompsonSamplingPolicy(const ArmSet &_true_means, std::uint32_t seed = 1)
        : Policy(_true_means, seed), alpha(_true_means.size(), 1), beta(_true_means.size(), 1)
    {
    }

    ui select() override
    {
        vector<double> sampled_means(arms());
        for (ui k = 0; k < arms(); k++)
        {
            boost::random::beta_distribution<double> belief(alpha[k], beta[k]);
            sampled_means[k] = belief(rng);
        }
        return static_cast<ui>(argmax_first(sampled_means));
    }

    void update(ui arm, double reward) override
    {
        record(arm, reward);
        if (reward == 1.0)
        {
            alpha[arm] += 1;
        }
        else
        {
            beta[arm] += 1;
        }
    }

    PolicySummary report() const override
    {
        double successes = std::accumulate(alpha.begin(), alpha.end(), 0.0);
        double failures = std::accumulate(beta.begin(), beta.end(), 0.0);
        double avg_reward = successes / (successes + failures);
        return PolicySummary{name(), avg_reward, best_mean(true_means) - avg_reward};
    }

    std::string describe() const override { return "ThompsonSampling Bandit"; }
    std::string name() const override { return "ThompsonSampling"; }
    std::string label() const override { return "Thompson Sampling"; }
};
#endif
