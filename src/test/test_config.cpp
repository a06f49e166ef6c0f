#include <catch2/catch.hpp>

#include "comparison.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "policy_registry.hpp"
#include "test_utils.hpp"

TEST_CASE("Parse the means list", "[config]")
{
	REQUIRE(parse_means("1,2,3,4") == ArmSet{1, 2, 3, 4});
	REQUIRE(parse_means(" 0.25 , 0.75") == ArmSet{0.25, 0.75});
	REQUIRE(parse_means("-1.5") == ArmSet{-1.5});

	REQUIRE_THROWS_AS(parse_means(""), InvalidConfiguration);
	REQUIRE_THROWS_AS(parse_means("1,,2"), InvalidConfiguration);
	REQUIRE_THROWS_AS(parse_means("1,two"), InvalidConfiguration);
	REQUIRE_THROWS_AS(parse_means("1,2x"), InvalidConfiguration);
}

TEST_CASE("Split policy names", "[config]")
{
	REQUIRE(split_names("epsilon-greedy,thompson") ==
		std::vector<std::string>{"epsilon-greedy", "thompson"});
	REQUIRE(split_names(" thompson ,, ") == std::vector<std::string>{"thompson"});
	REQUIRE(split_names("").empty());
}

TEST_CASE("Validate the comparison config", "[config][errors]")
{
	ComparisonConfig config;
	REQUIRE_NOTHROW(config.validate());
	REQUIRE(config.num_trials == 20000);
	REQUIRE(config.epsilon == 0.2);
	REQUIRE(config.true_means == ArmSet{1, 2, 3, 4});

	SECTION("no arms") {
		config.true_means.clear();
		REQUIRE_THROWS_AS(config.validate(), InvalidConfiguration);
	}
	SECTION("epsilon out of range") {
		config.epsilon = 1.01;
		REQUIRE_THROWS_AS(config.validate(), InvalidConfiguration);
		config.epsilon = -0.5;
		REQUIRE_THROWS_AS(config.validate(), InvalidConfiguration);
	}
	SECTION("no trials") {
		config.num_trials = 0;
		REQUIRE_THROWS_AS(config.validate(), InvalidConfiguration);
	}
	SECTION("unknown or missing policy") {
		config.policies = {"ucb"};
		REQUIRE_THROWS_AS(config.validate(), InvalidConfiguration);
		config.policies.clear();
		REQUIRE_THROWS_AS(config.validate(), InvalidConfiguration);
	}
	SECTION("bernoulli needs probabilities") {
		config.reward_model = RewardModel::BERNOULLI;
		REQUIRE_THROWS_AS(config.validate(), InvalidConfiguration);
		config.true_means = {0.2, 0.8};
		REQUIRE_NOTHROW(config.validate());
	}
}

TEST_CASE("Policy registry", "[config][registry]")
{
	PolicyRegistry registry;
	REQUIRE(registry.names() == std::vector<std::string>{"epsilon-greedy", "thompson"});

	auto greedy = registry.create("epsilon-greedy", {1, 2}, PolicyOptions{0.3}, 5);
	REQUIRE(greedy->name() == "EpsilonGreedy");
	REQUIRE(greedy->describe() == "EpsilonGreedy Bandit with epsilon=0.3");

	auto thompson = registry.create("thompson", {1, 2}, PolicyOptions{0.3}, 5);
	REQUIRE(thompson->name() == "ThompsonSampling");

	REQUIRE_THROWS_AS(registry.create("ucb", {1, 2}, PolicyOptions{0.3}, 5), InvalidConfiguration);
	REQUIRE_THROWS_AS(registry.create("epsilon-greedy", {1, 2}, PolicyOptions{2.0}, 5), InvalidConfiguration);
}

TEST_CASE("Named process logger", "[logging]")
{
	auto logger = setup_logging("debug");
	REQUIRE(logger->name() == "MAB Application");
	REQUIRE(logger->level() == spdlog::level::debug);
	REQUIRE(get_logger() == logger);

	setup_logging("warning");
	REQUIRE(logger->level() == spdlog::level::warn);
	setup_logging("not-a-level");
	REQUIRE(logger->level() == spdlog::level::info);
}

TEST_CASE("Comparison of both policies", "[comparison]")
{
	ScratchDir dir("comparison");
	std::ostringstream log;

	ComparisonConfig config;
	config.num_trials = 50;
	config.seed = 12345;
	config.rewards_path = dir.file("rewards.csv");
	config.curves_path = dir.file("curves.csv");
	config.plot_path = dir.file("plots.gp");

	auto result = comparison(config, capture_logger(log));

	REQUIRE(result.seed == 12345);
	REQUIRE(result.runs.size() == 2);
	REQUIRE(result.runs[0].bandit == "EpsilonGreedy");
	REQUIRE(result.runs[1].bandit == "ThompsonSampling");
	for (auto &run : result.runs) {
		REQUIRE(run.rewards.size() == 50);
	}
	REQUIRE(result.summaries.size() == 2);
	REQUIRE(result.totals.size() == 2);
	for (auto &total : result.totals) {
		REQUIRE(total.regret >= 0.0);
		REQUIRE(total.reward + total.regret == Approx(4.0 * 50));
	}

	REQUIRE(read_lines(config.rewards_path).size() == 101);
	REQUIRE(read_lines(config.curves_path).size() == 51);
	REQUIRE(std::filesystem::exists(config.plot_path));
	CHECK_THAT(log.str(), Catch::Contains("EpsilonGreedy Results: Average Reward="));
	CHECK_THAT(log.str(), Catch::Contains("Cumulative Regret - Thompson Sampling: "));

	SECTION("same seed, same rewards") {
		config.rewards_path.clear();
		config.curves_path.clear();
		auto again = comparison(config, capture_logger(log));
		REQUIRE(again.runs[0].rewards == result.runs[0].rewards);
		REQUIRE(again.runs[1].rewards == result.runs[1].rewards);
	}
}

TEST_CASE("Comparison stops on a bad config", "[comparison][errors]")
{
	std::ostringstream log;
	ComparisonConfig config;
	config.num_trials = -1;
	config.rewards_path.clear();
	config.curves_path.clear();
	REQUIRE_THROWS_AS(comparison(config, capture_logger(log)), InvalidConfiguration);
}
