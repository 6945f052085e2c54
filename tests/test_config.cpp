#include "ind/indicators.h"
#include "risk/safety.h"
#include "util/config.h"

#include <gtest/gtest.h>
#include <filesystem>
#include <format>
#include <fstream>

namespace fs = std::filesystem;

class ConfigFiles : public ::testing::Test {
 protected:
  fs::path dir;

  void SetUp() override {
    auto name = ::testing::UnitTest::GetInstance()->current_test_info()->name();
    dir = fs::temp_directory_path() / std::format("chartsig_{}", name);
    fs::remove_all(dir);
    fs::create_directories(dir);
  }

  void TearDown() override { fs::remove_all(dir); }

  void write(const std::string& file, const std::string& content) {
    std::ofstream f{dir / file};
    f << content;
  }
};

TEST_F(ConfigFiles, MissingFilesKeepDefaults) {
  Config cfg;
  cfg.update(dir.string());

  EXPECT_EQ(cfg.ind_config.rsi_period, 14);
  EXPECT_EQ(cfg.candle_config.scan_max_signals, 10u);
  EXPECT_EQ(cfg.pattern_config.min_bars, 10u);
  EXPECT_EQ(cfg.sig_config.decision_margin, 50.0);
  EXPECT_EQ(cfg.safety_config.high_volatility, 50.0);
}

TEST_F(ConfigFiles, PartialOverride) {
  write("indicators.json", R"({"rsi_period": 7, "sma_period": 50})");
  write("patterns.json", R"({"double_tolerance": 0.02})");
  write("safety.json",
        R"({"high_volatility": 40, "balanced": {"surge": 35, "decline": -12}})");

  Config cfg;
  cfg.update(dir.string());

  EXPECT_EQ(cfg.ind_config.rsi_period, 7);
  EXPECT_EQ(cfg.ind_config.sma_period, 50);
  EXPECT_EQ(cfg.ind_config.macd_slow, 26);

  EXPECT_DOUBLE_EQ(cfg.pattern_config.double_tolerance, 0.02);
  EXPECT_EQ(cfg.pattern_config.extrema_window, 2u);

  EXPECT_DOUBLE_EQ(cfg.safety_config.high_volatility, 40.0);
  EXPECT_EQ(cfg.safety_config.balanced.surge, 35.0);
  EXPECT_DOUBLE_EQ(cfg.safety_config.balanced.decline, -12.0);
  EXPECT_FALSE(cfg.safety_config.aggressive.surge.has_value());
}

TEST_F(ConfigFiles, BrokenFileIsIgnored) {
  write("signal.json", R"({"decision_margin": )");
  write("candles.json", R"({"doji_range": 0.5, "no_such_key": 1})");

  Config cfg;
  cfg.update(dir.string());

  EXPECT_EQ(cfg.sig_config.decision_margin, 50.0);
  EXPECT_DOUBLE_EQ(cfg.candle_config.doji_range, 0.01);
}

TEST_F(ConfigFiles, DeviationBoundDrivesZoneAndOverheat) {
  write("indicators.json", R"({"deviation_upper": 15})");

  Config cfg;
  cfg.update(dir.string());

  EXPECT_EQ(classify_deviation(16.0, cfg.ind_config),
            DeviationZone::Overheated);
  EXPECT_TRUE(is_overheated(16.0, Style::Balanced, cfg.safety_config,
                            cfg.ind_config));
}

inline bool parse(Config& cfg, std::vector<std::string> args) {
  args.insert(args.begin(), "chartsig");
  std::vector<char*> argv;
  for (auto& a : args)
    argv.push_back(a.data());
  return cfg.read_args(static_cast<int>(argv.size()), argv.data());
}

TEST(ConfigArgs, Defaults) {
  Config cfg;
  ASSERT_TRUE(parse(cfg, {"bars.json"}));

  EXPECT_EQ(cfg.input_path, "bars.json");
  EXPECT_EQ(cfg.config_dir, "config");
  EXPECT_FALSE(cfg.debug_en);
  EXPECT_FALSE(cfg.newest_first);
  EXPECT_FALSE(cfg.pretty);
  EXPECT_FALSE(cfg.text);
  EXPECT_TRUE(cfg.as_of.empty());
  EXPECT_EQ(cfg.max_age_days, 5);
  EXPECT_FALSE(cfg.volatility.has_value());
  EXPECT_FALSE(cfg.profitable.has_value());
}

TEST(ConfigArgs, AllFlags) {
  Config cfg;
  ASSERT_TRUE(parse(cfg, {"bars.json", "--newest-first", "--pretty", "-d",
                          "--config", "conf", "--as-of", "2024-05-01",
                          "--max-age", "3", "--style", "short",
                          "--volatility", "62.5", "--unprofitable"}));

  EXPECT_TRUE(cfg.newest_first);
  EXPECT_TRUE(cfg.pretty);
  EXPECT_TRUE(cfg.debug_en);
  EXPECT_EQ(cfg.config_dir, "conf");
  EXPECT_EQ(cfg.as_of, "2024-05-01");
  EXPECT_EQ(cfg.max_age_days, 3);
  EXPECT_EQ(cfg.style, "short");
  EXPECT_EQ(cfg.volatility, 62.5);
  EXPECT_EQ(cfg.profitable, false);
}

TEST(ConfigArgs, MissingInputFails) {
  Config cfg;
  EXPECT_FALSE(parse(cfg, {}));
}

TEST(ConfigArgs, Profitability) {
  Config profitable;
  ASSERT_TRUE(parse(profitable, {"bars.json", "--profitable"}));
  EXPECT_EQ(profitable.profitable, true);

  Config both;
  EXPECT_FALSE(parse(both, {"bars.json", "--profitable", "--unprofitable"}));
  EXPECT_FALSE(both.profitable.has_value());
}
