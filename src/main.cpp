#include "core/analysis.h"
#include "core/serialization.h"
#include "mt/thread_pool.h"
#include "util/config.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <format>
#include <iostream>
#include <mutex>

namespace fs = std::filesystem;

inline void init_logging() {
  auto logger = config.log_file.empty()
                    ? spdlog::stderr_color_mt("console")
                    : spdlog::basic_logger_mt("file_logger", config.log_file);
  spdlog::set_default_logger(logger);

  auto level = config.debug_en ? spdlog::level::debug : spdlog::level::info;
  spdlog::set_level(level);
  spdlog::flush_on(level);

  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");
}

inline bool ensure_directory_exists(const std::string& dir) {
  fs::path path{dir};
  if (fs::exists(path))
    return true;

  std::error_code ec;
  if (fs::create_directories(path, ec))
    return true;

  spdlog::error("[io] failed to create {}: {}", dir, ec.message());
  return false;
}

inline std::optional<LocalTimePoint> date_arg(const std::string& str) {
  if (str.empty())
    return std::nullopt;
  return date_to_local(str);
}

std::mutex stdout_mtx;

inline bool run(const std::string& path) {
  auto req = read_request_file(path);
  if (!req)
    return false;

  auto symbol = req->symbol.empty() ? fs::path{path}.stem().string()
                                    : req->symbol;
  auto candles = select_window(req->candles, date_arg(config.from_date),
                               date_arg(config.to_date), config.max_candles);

  AnalysisRecord rec;
  try {
    rec = analyze(symbol, candles, req->quote, req->analyst);
  } catch (const NoDataAvailable& ex) {
    spdlog::error("[analysis] {}: {}", path, ex.what());
    return false;
  }

  if (!config.output_dir.empty()) {
    auto out = fs::path{config.output_dir} / (symbol + "_analysis.json");
    return write_record_file(rec, out.string());
  }

  auto json = write_record_json(rec);
  if (json.empty())
    return false;

  std::lock_guard lk{stdout_mtx};
  std::cout << json << std::endl;
  return true;
}

int main(int argc, char* argv[]) {
  if (!config.read_args(argc, argv))
    return 2;

  init_logging();
  config.update(config.config_dir);

  if (!config.output_dir.empty() && !ensure_directory_exists(config.output_dir))
    return 1;

  std::atomic<size_t> n_failed = 0;
  {
    auto n_threads = std::min(config.n_concurrency, config.inputs.size());
    thread_pool<std::string> pool{
        n_threads,
        [&n_failed](std::string&& path) {
          if (!run(path))
            n_failed++;
          return true;
        },
        config.inputs};
  }

  if (n_failed > 0) {
    spdlog::error("[exit] {} of {} requests failed", n_failed.load(),
                  config.inputs.size());
    return 1;
  }
  return 0;
}
