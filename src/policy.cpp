#include "policy.hpp"
#include "errors.hpp"
#include <fmt/format.h>
#include <random>

std::string PolicySummary::str() const
{
    return fmt::format("{} Results: Average Reward={:.2f}, Average Regret={:.2f}",
                       name, avg_reward, avg_regret);
}

Policy::Policy(const ArmSet &_true_means, std::uint32_t seed)
    : true_means(_true_means),
      estimated_means(_true_means.size(), 0.0),
      action_counts(_true_means.size(), 0),
      rng(seed)
{
    require(!true_means.empty(), "a policy needs at least one arm");
}

void Policy::check_arm(ui arm) const
{
    if (arm >= arms())
    {
        throw InvalidArmIndex(fmt::format("arm index {} outside [0, {})", arm, arms()));
    }
}

ui Policy::record(ui arm, double reward)
{
    check_arm(arm);
    ui n = ++action_counts[arm];
    estimated_means[arm] += (reward - estimated_means[arm]) / n;
    return n;
}

std::uint32_t resolve_seed(std::uint32_t seed)
{
    if (seed != 0)
    {
        return seed;
    }
    std::random_device device;
    std::uint32_t drawn = device();
    // keep 0 reserved for "unseeded"
    return drawn == 0 ? 1 : drawn;
}
