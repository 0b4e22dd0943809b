#include "spme/matching/match_config.h"

#include "spme/matching/presets.h"

#include <cmath>
#include <string>

namespace spme::matching {

namespace {

bool in_unit_range(const double value) {
  return std::isfinite(value) && value >= 0.0 && value <= 1.0;
}

bool valid_weight(const double value) {
  return std::isfinite(value) && value >= 0.0;
}

}  // namespace

double MatchConfig::effective_threshold() const {
  return threshold.value_or(threshold_preset(mode));
}

core::Result<bool, std::string> validate_config(const MatchConfig& config) {
  using R = core::Result<bool, std::string>;

  if (config.threshold.has_value() && !in_unit_range(config.threshold.value())) {
    return R::err("threshold must be within [0,1]");
  }
  if (!in_unit_range(config.auto_confirm_threshold)) {
    return R::err("auto_confirm_threshold must be within [0,1]");
  }

  const auto& tw = config.text_weights;
  if (!valid_weight(tw.char_jaccard) || !valid_weight(tw.bigram) || !valid_weight(tw.trigram)) {
    return R::err("text weights must be finite and non-negative");
  }
  if (tw.char_jaccard + tw.bigram + tw.trigram <= 0.0) {
    return R::err("text weights must not all be zero");
  }

  const auto& hw = config.hybrid_weights;
  if (!valid_weight(hw.text) || !valid_weight(hw.image)) {
    return R::err("hybrid weights must be finite and non-negative");
  }
  if (hw.text + hw.image <= 0.0) {
    return R::err("hybrid weights must not all be zero");
  }

  if (config.hash_grid < 2 || config.hash_grid > 64) {
    return R::err("hash_grid must be between 2 and 64");
  }

  if (config.worker_count > kMaxWorkerCount) {
    return R::err("worker_count must not exceed " + std::to_string(kMaxWorkerCount));
  }

  return R::ok(true);
}

std::string_view match_mode_to_string(const MatchMode mode) {
  switch (mode) {
    case MatchMode::kText:
      return "text";
    case MatchMode::kImage:
      return "image";
    case MatchMode::kHybrid:
      return "hybrid";
  }
  return "unknown";
}

std::optional<MatchMode> match_mode_from_string(const std::string_view value) {
  if (value == "text") {
    return MatchMode::kText;
  }
  if (value == "image") {
    return MatchMode::kImage;
  }
  if (value == "hybrid") {
    return MatchMode::kHybrid;
  }
  return std::nullopt;
}

std::string_view blocking_to_string(const BlockingStrategy blocking) {
  switch (blocking) {
    case BlockingStrategy::kNone:
      return "none";
    case BlockingStrategy::kFirstBigram:
      return "first_bigram";
    case BlockingStrategy::kPriceBand:
      return "price_band";
  }
  return "unknown";
}

std::optional<BlockingStrategy> blocking_from_string(const std::string_view value) {
  if (value == "none") {
    return BlockingStrategy::kNone;
  }
  if (value == "first_bigram") {
    return BlockingStrategy::kFirstBigram;
  }
  if (value == "price_band") {
    return BlockingStrategy::kPriceBand;
  }
  return std::nullopt;
}

}  // namespace spme::matching
