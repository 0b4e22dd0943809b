#pragma once

#include "spme/core/result.h"
#include "spme/domain/matching_group.h"
#include "spme/domain/pair_score.h"
#include "spme/domain/raw_product.h"
#include "spme/domain/warning.h"
#include "spme/matching/engine.h"
#include "spme/matching/match_config.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace spme::app {

// JSON boundary of the engine: product batches in, run results out.
//
// A product batch is either an array of records or {"products": [...]}. Record fields:
//   id, supplier_id     string or integer (required)
//   name                string (required)
//   price               number (required), currency string (default "CNY")
//   url, english_name, normalized_name        optional strings
//   image_hash          optional hex string, image_hash_algorithm optional tag
//   image               optional {"path": "<file>"} or {"bytes": [0..255, ...]} (encoded file)
// null is treated as absent for optional fields.

// products_from_json decodes a batch. Type errors are reported as
// kMalformedInput carrying the offending record's index. Value checks
// (empty name, negative price) are left to the engine.
[[nodiscard]] core::Result<std::vector<domain::RawProduct>, matching::MatchError>
products_from_json(const nlohmann::json& j);

struct ResultJsonOptions {
  bool include_pair_scores{true};
  bool include_features{false};
};

[[nodiscard]] nlohmann::json warning_to_json(const domain::DataQualityWarning& warning);
[[nodiscard]] nlohmann::json pair_score_to_json(const domain::PairScore& score);
[[nodiscard]] nlohmann::json group_to_json(const domain::MatchingGroup& group);
[[nodiscard]] nlohmann::json stats_to_json(const matching::RunStats& stats);
[[nodiscard]] nlohmann::json run_result_to_json(const matching::MatchRunResult& result,
                                                const ResultJsonOptions& options = {});
[[nodiscard]] nlohmann::json match_error_to_json(const matching::MatchError& error);

// MatchConfig <-> JSON. Absent keys keep their defaults; config_from_json also
// applies validate_config so a bad file is rejected before any product is read.
[[nodiscard]] nlohmann::json config_to_json(const matching::MatchConfig& config);
[[nodiscard]] core::Result<matching::MatchConfig, std::string> config_from_json(
    const nlohmann::json& j);

}  // namespace spme::app
