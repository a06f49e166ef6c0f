#include "argparse.hpp"
#include "comparison.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <cstdlib>
struct MyArgs : public argparse::Args {
  int &trials = kwarg("n,trials", "Number of trials per policy").set_default(kDefaultTrials);
  double &epsilon =
      kwarg("e,epsilon", "Exploration probability of epsilon-greedy").set_default(0.2);
  std::string &means =
      kwarg("m,means", "Comma separated true mean of every arm").set_default("1,2,3,4");
  std::string &policies =
      kwarg("p,policies", "Comma separated policies to compare")
          .set_default("epsilon-greedy,thompson");
  std::string &output =
      kwarg("o,output", "Output path for the rewards table").set_default("bandit_rewards.csv");
  std::string &curves =
      kwarg("curves", "Output path for the cumulative reward curves").set_default("bandit_curves.csv");
  std::string &plot = kwarg("plot", "Output path for the gnuplot script").set_default("bandit_plots.gp");
  int &seed = kwarg("s,seed", "Base seed, 0 draws one at random").set_default(0);
  std::string &reward =
      kwarg("r,reward", "Reward model: true-mean or bernoulli").set_default("true-mean");
  std::string &log_level = kwarg("l,log-level", "Log level").set_default("info");
};
int main(int argc, char *argv[]) {
  auto args = argparse::parse<MyArgs>(argc, argv);
  auto logger = setup_logging(args.log_level);

  try {
    ComparisonConfig config;
    config.true_means = parse_means(args.means);
    config.epsilon = args.epsilon;
    config.num_trials = args.trials;
    config.policies = split_names(args.policies);
    config.reward_model = parse_reward_model(args.reward);
    require(args.seed >= 0, "seed must not be negative");
    config.seed = static_cast<std::uint32_t>(args.seed);
    config.rewards_path = args.output;
    config.curves_path = args.curves;
    config.plot_path = args.plot;

    comparison(config, logger);
  } catch (const std::exception &e) {
    logger->error("{}", e.what());
    return EXIT_FAILURE;
  }
  return 0;
}
