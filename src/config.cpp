#include "config.hpp"
#include "errors.hpp"
#include "policy_registry.hpp"
#include <fmt/format.h>
#include <sstream>

namespace
{
std::string trim(const std::string &s)
{
  auto first = s.find_first_not_of(" \t");
  if (first == std::string::npos)
    return "";
  auto last = s.find_last_not_of(" \t");
  return s.substr(first, last - first + 1);
}
} // namespace

ArmSet parse_means(const std::string &text) {
  ArmSet result;
  std::stringstream ss(text);
  std::string token;
  while (std::getline(ss, token, ',')) {
    token = trim(token);
    require(!token.empty(), "empty entry in means list '" + text + "'");
    std::size_t used = 0;
    double value = 0.0;
    try {
      value = std::stod(token, &used);
    } catch (const std::exception &) {
      throw InvalidConfiguration("not a number in means list: '" + token + "'");
    }
    require(used == token.size(), "not a number in means list: '" + token + "'");
    result.push_back(value);
  }
  require(!result.empty(), "means list is empty");
  return result;
}

std::vector<std::string> split_names(const std::string &text) {
  std::vector<std::string> result;
  std::stringstream ss(text);
  std::string token;
  while (std::getline(ss, token, ',')) {
    token = trim(token);
    if (!token.empty()) {
      result.push_back(token);
    }
  }
  return result;
}

void ComparisonConfig::validate() const {
  require(!true_means.empty(), "at least one arm is required");
  require(epsilon >= 0.0 && epsilon <= 1.0,
          fmt::format("epsilon must lie in [0, 1], got {}", epsilon));
  require(num_trials > 0,
          fmt::format("num_trials must be positive, got {}", num_trials));
  require(!policies.empty(), "no policies selected");

  PolicyRegistry registry;
  for (auto &name : policies) {
    require(registry.contains(name), "unknown policy '" + name + "'");
  }
  if (reward_model == RewardModel::BERNOULLI) {
    for (auto mean : true_means) {
      require(mean >= 0.0 && mean <= 1.0,
              fmt::format("bernoulli rewards need true means in [0, 1], got {}", mean));
    }
  }
}
