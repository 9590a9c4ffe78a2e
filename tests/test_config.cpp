#include <cmath>
#include <cstdint>
#include <limits>
#include <gtest/gtest.h>
#include <markov/core/errors.hpp>
#include <markov/sample/metropolis.hpp>
#include <string>

using namespace markov::sample;

TEST(Config, DefaultsMatchDocumentedValues) {
  MetropolisConfig cfg;
  EXPECT_EQ(cfg.chain, 5000u);
  EXPECT_DOUBLE_EQ(cfg.theta_init, 0.5);
  EXPECT_EQ(cfg.burnin, 0u);
  EXPECT_FALSE(cfg.seed.has_value());
  EXPECT_TRUE(std::isinf(cfg.space.lo) && cfg.space.lo < 0);
  EXPECT_TRUE(std::isinf(cfg.space.hi) && cfg.space.hi > 0);
  EXPECT_NE(cfg.jump, nullptr);
}

TEST(Config, UpdatesApplyInOrder) {
  MetropolisConfig base(uniform_pdf(0.0, 1.0));
  auto jump = std::make_shared<UniformJump>(-0.1, 0.1);

  MetropolisConfig cfg = updated(base, {{"chain", 50},
                                        {"theta_init", 0.2},
                                        {"jumpdist", JumpPtr(jump)},
                                        {"space", Space{0.0, 1.0}},
                                        {"burnin", 5},
                                        {"seed", 72},
                                        {"chain", 60}});

  EXPECT_EQ(cfg.chain, 60u);
  EXPECT_DOUBLE_EQ(cfg.theta_init, 0.2);
  EXPECT_EQ(cfg.jump, jump);
  EXPECT_DOUBLE_EQ(cfg.space.lo, 0.0);
  EXPECT_DOUBLE_EQ(cfg.space.hi, 1.0);
  EXPECT_EQ(cfg.burnin, 5u);
  ASSERT_TRUE(cfg.seed.has_value());
  EXPECT_EQ(*cfg.seed, 72u);

  // base untouched
  EXPECT_EQ(base.chain, 5000u);
  EXPECT_FALSE(base.seed.has_value());
}

TEST(Config, UpdatedConfigRunsLikeDirectConfig) {
  MetropolisConfig direct(beta_pdf(15.0, 7.0));
  direct.chain = 50;
  direct.theta_init = 0.1;
  direct.space = {0.0, 1.0};
  direct.burnin = 5;
  direct.seed = 72;

  MetropolisConfig via = updated(MetropolisConfig(beta_pdf(15.0, 7.0)),
                                 {{"space", Space{0.0, 1.0}},
                                  {"burnin", 5},
                                  {"seed", 72},
                                  {"chain", 50},
                                  {"theta_init", 0.1}});

  EXPECT_EQ(run(direct), run(via));
  EXPECT_EQ(run(via).size(), 45u);
}

TEST(Config, SeedCanBeCleared) {
  MetropolisConfig cfg;
  cfg.seed = 3;
  cfg = updated(cfg, {{"seed", std::nullopt}});
  EXPECT_FALSE(cfg.seed.has_value());
}

TEST(Config, FullRangeSeedAccepted) {
  const std::uint64_t max_seed = std::numeric_limits<std::uint64_t>::max();
  MetropolisConfig cfg = updated(MetropolisConfig(), {{"seed", SeedValue{max_seed}}});
  ASSERT_TRUE(cfg.seed.has_value());
  EXPECT_EQ(*cfg.seed, max_seed);

  cfg = updated(cfg, {{"seed", SeedValue{}}});
  EXPECT_FALSE(cfg.seed.has_value());
}

TEST(Config, DensityCanBeReplaced) {
  MetropolisConfig cfg;
  cfg = updated(cfg, {{"density", DensityFn([](double) { return 1.0; })}});
  ASSERT_TRUE(static_cast<bool>(cfg.density));
  EXPECT_DOUBLE_EQ(cfg.density(3.0), 1.0);
}

TEST(Config, IntegerThetaInitAccepted) {
  MetropolisConfig cfg = updated(MetropolisConfig(), {{"theta_init", 2}});
  EXPECT_DOUBLE_EQ(cfg.theta_init, 2.0);
}

TEST(Config, UnknownKeyRejected) {
  try {
    updated(MetropolisConfig(), {{"chains", 10}});
    FAIL() << "expected ConfigurationError";
  } catch (const markov::ConfigurationError &e) {
    EXPECT_NE(std::string(e.what()).find("not supported"), std::string::npos);
  }
}

TEST(Config, WrongValueTypeRejected) {
  EXPECT_THROW(updated(MetropolisConfig(), {{"chain", 2.5}}), markov::ConfigurationError);
  EXPECT_THROW(updated(MetropolisConfig(), {{"space", 1.0}}), markov::ConfigurationError);
  EXPECT_THROW(updated(MetropolisConfig(), {{"burnin", -1}}), markov::ConfigurationError);
  EXPECT_THROW(updated(MetropolisConfig(), {{"seed", -5}}), markov::ConfigurationError);
}
