#pragma once

#include "core/analysis.h"

#include <optional>
#include <string>

// One symbol's input: candles oldest first, optional quote and consensus.
struct AnalysisRequest {
  std::string symbol;
  Candles candles;
  std::optional<Quote> quote;
  std::optional<AnalystConsensus> analyst;
};

std::optional<AnalysisRequest> read_request_json(const std::string& str);
std::optional<AnalysisRequest> read_request_file(const std::string& path);

std::string write_record_json(const AnalysisRecord& rec);
bool write_record_file(const AnalysisRecord& rec, const std::string& path);
