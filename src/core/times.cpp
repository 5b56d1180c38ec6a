#include "util/times.h"

#include <spdlog/spdlog.h>
#include <format>
#include <sstream>

using namespace std::chrono;

LocalTimePoint datetime_to_local(std::string_view datetime,
                                 std::string_view fmt) {
  if (datetime == "") {
    spdlog::error("[time] empty datetime string");
    return {};
  }

  std::istringstream in{std::string(datetime)};

  local_time<seconds> local;
  in >> parse(std::string(fmt), local);
  if (in.fail()) {
    spdlog::error("[time] could not parse '{}' as {}", datetime, fmt);
    return {};
  }

  return local;
}

std::string date_to_string(LocalTimePoint tp) {
  return std::format("{:%F}", floor<days>(tp));
}

std::string today_str() {
  return std::format("{:%F}", floor<days>(system_clock::now()));
}
