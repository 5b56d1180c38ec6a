#include "util/config.h"

#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <algorithm>
#include <filesystem>
#include <glaze/glaze.hpp>
#include <iostream>
#include <thread>

namespace fs = std::filesystem;

template <typename T>
T read(const fs::path& path, const T& fallback) {
  if (!fs::exists(path)) {
    spdlog::debug("[config] {} not found, using defaults", path.string());
    return fallback;
  }

  T t = fallback;
  auto ec = glz::read_file_json<glz::opts{.error_on_unknown_keys = false}>(
      t, path.string(), std::string{});
  if (ec) {
    spdlog::warn("[config] {} error {}, using defaults", path.string(),
                 glz::format_error(ec));
    return fallback;
  }

  if (T::debug) {
    std::string buffer;
    auto wec = glz::write<glz::opts{.prettify = true}>(t, buffer);
    if (!wec)
      spdlog::debug("[config] \"{}\": {}", T::name, buffer);
  }

  return t;
}

void Config::update(const std::string& dir) {
  fs::path root{dir};

  ind_config = read(root / "indicators.json", IndicatorsConfig{});
  levels_config = read(root / "levels.json", LevelsConfig{});
  trend_config = read(root / "trend.json", TrendConfig{});
  target_config = read(root / "target.json", TargetConfig{});
  confidence_config = read(root / "confidence.json", ConfidenceConfig{});
  recommendation_config =
      read(root / "recommendation.json", RecommendationConfig{});
  analysis_config = read(root / "analysis.json", AnalysisConfig{});
}

bool Config::read_args(int argc, char* argv[]) {
  argparse::ArgumentParser program("pricetarget");

  program.add_argument("inputs")
      .help("Analysis request files (JSON)")
      .nargs(argparse::nargs_pattern::at_least_one);

  program.add_argument("-d", "--debug")
      .default_value(false)
      .implicit_value(true)
      .help("Enable debug");

  program.add_argument("--config")
      .help("Directory holding the JSON config overrides")
      .default_value(std::string{CONFIG_DIR_DEFAULT});

  program.add_argument("-o", "--output")
      .help("Directory for <SYMBOL>_analysis.json, stdout if absent")
      .default_value(std::string{});

  program.add_argument("--log-file")
      .help("Write logs to this file instead of stderr")
      .default_value(std::string{});

  program.add_argument("--max-candles")
      .help("Keep only the most recent N candles, 0 keeps all")
      .default_value(MAX_CANDLES_DEFAULT)
      .scan<'d', size_t>();

  program.add_argument("--from")
      .help("Drop candles before this date (YYYY-MM-DD)")
      .default_value(std::string{});

  program.add_argument("--to")
      .help("Drop candles after this date (YYYY-MM-DD)")
      .default_value(std::string{});

  auto def_nthreads = static_cast<size_t>(std::thread::hardware_concurrency());
  program.add_argument("--nthreads")
      .help("Max number of symbols analyzed concurrently")
      .default_value(def_nthreads == 0 ? size_t{1} : def_nthreads)
      .scan<'d', size_t>();

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& err) {
    std::cerr << err.what() << "\n" << program << "\n";
    return false;
  }

  inputs = program.get<std::vector<std::string>>("inputs");
  debug_en = program.get<bool>("--debug");
  config_dir = program.get<std::string>("--config");
  output_dir = program.get<std::string>("--output");
  log_file = program.get<std::string>("--log-file");
  max_candles = program.get<size_t>("--max-candles");
  from_date = program.get<std::string>("--from");
  to_date = program.get<std::string>("--to");
  n_concurrency = std::max(size_t{1}, program.get<size_t>("--nthreads"));

  return true;
}
