#include "util/config.h"

#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <filesystem>
#include <glaze/glaze.hpp>
#include <iostream>

namespace fs = std::filesystem;

// A missing or broken file keeps the current values
template <typename T>
void read(T& t, const fs::path& path) {
  if (!fs::exists(path)) {
    spdlog::debug("[config] {} not found, keeping defaults", path.string());
    return;
  }

  T tmp = t;
  auto ec = glz::read_file_json(tmp, path.string(), std::string{});
  if (ec) {
    spdlog::warn("[config] {} error {}", path.string(), glz::format_error(ec));
    return;
  }
  t = tmp;

  if (spdlog::should_log(spdlog::level::debug)) {
    std::string buffer;
    auto _ = glz::write<glz::opts{.prettify = true}>(t, buffer);
    spdlog::debug("[config] \"{}\": {}", T::name, buffer);
  }
}

void Config::update(const std::string& dir) {
  fs::path base{dir};

  read(ind_config, base / "indicators.json");
  read(candle_config, base / "candles.json");
  read(pattern_config, base / "patterns.json");
  read(sig_config, base / "signal.json");
  read(safety_config, base / "safety.json");
}

bool Config::read_args(int argc, char* argv[]) {
  argparse::ArgumentParser program("chartsig");

  program.add_argument("input").help("JSON array of daily price bars");

  program.add_argument("-d", "--debug")
      .default_value(false)
      .implicit_value(true)
      .help("Enable debug");

  program.add_argument("-n", "--newest-first")
      .default_value(false)
      .implicit_value(true)
      .help("Input bars are ordered newest first");

  program.add_argument("-p", "--pretty")
      .default_value(false)
      .implicit_value(true)
      .help("Indent the JSON report");

  program.add_argument("-t", "--text")
      .default_value(false)
      .implicit_value(true)
      .help("Print a plain text summary instead of JSON");

  program.add_argument("-c", "--config")
      .help("Directory holding the json config files")
      .default_value(std::string{"config"});

  program.add_argument("--as-of")
      .help("Reference date (YYYY-MM-DD) for the freshness check")
      .default_value(std::string{});

  program.add_argument("--max-age")
      .help("Max days between the latest bar and --as-of")
      .default_value(5)
      .scan<'d', int>();

  program.add_argument("-s", "--style")
      .help("conservative, balanced, aggressive (or long, medium, short)")
      .default_value(std::string{});

  program.add_argument("--volatility")
      .help("Annualised volatility in percent")
      .scan<'g', double>();

  program.add_argument("--profitable")
      .default_value(false)
      .implicit_value(true)
      .help("The company is profitable");

  program.add_argument("--unprofitable")
      .default_value(false)
      .implicit_value(true)
      .help("The company is loss-making");

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& err) {
    std::cerr << err.what() << "\n" << program << "\n";
    return false;
  }

  input_path = program.get<std::string>("input");
  debug_en = program.get<bool>("--debug");
  newest_first = program.get<bool>("--newest-first");
  pretty = program.get<bool>("--pretty");
  text = program.get<bool>("--text");
  config_dir = program.get<std::string>("--config");
  as_of = program.get<std::string>("--as-of");
  max_age_days = program.get<int>("--max-age");
  style = program.get<std::string>("--style");
  volatility = program.present<double>("--volatility");

  if (program.get<bool>("--profitable") && program.get<bool>("--unprofitable")) {
    std::cerr << "--profitable and --unprofitable are mutually exclusive\n"
              << program << "\n";
    return false;
  }
  if (program.get<bool>("--unprofitable"))
    profitable = false;
  else if (program.get<bool>("--profitable"))
    profitable = true;

  return true;
}
