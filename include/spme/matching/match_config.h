#pragma once

#include "spme/core/normalization.h"
#include "spme/core/result.h"
#include "spme/similarity/hybrid_scorer.h"
#include "spme/similarity/perceptual_hasher.h"
#include "spme/similarity/text_similarity.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace spme::matching {

// MatchMode selects which signal decides a match.
enum class MatchMode {
  kText,    // normalized-name similarity only
  kImage,   // perceptual-hash similarity only; products without images are not compared
  kHybrid,  // weighted blend; falls back to text for pairs without an image score (default)
};

// BlockingStrategy prunes the cross-supplier pair space before scoring.
// Anything other than kNone trades recall for speed and is reported as a warning.
enum class BlockingStrategy {
  kNone,         // every cross-supplier pair is scored (default)
  kFirstBigram,  // only pairs sharing the first two normalized code points
  kPriceBand,    // only pairs priced within 30% of each other
};

// Upper bound on MatchConfig::worker_count.
inline constexpr std::size_t kMaxWorkerCount = 64;

// MatchConfig carries every tunable of a run. All weighting constants are
// defaults calibrated on a small sample and are expected to be retuned.
struct MatchConfig {
  MatchMode mode{MatchMode::kHybrid};
  std::optional<double> threshold;  // unset: preset for the mode
  similarity::TextWeights text_weights;
  similarity::HybridWeights hybrid_weights;
  BlockingStrategy blocking{BlockingStrategy::kNone};
  similarity::HashAlgorithm hash_algorithm{similarity::HashAlgorithm::kDifference};
  std::size_t hash_grid{8};
  std::size_t worker_count{0};          // 0: hardware concurrency; at most kMaxWorkerCount
  std::size_t parallel_threshold{256};  // candidate pairs below this are scored inline
  double auto_confirm_threshold{0.80};
  core::NormalizerOptions normalizer;

  // effective_threshold returns threshold if set, else the mode's preset.
  [[nodiscard]] double effective_threshold() const;
};

// validate_config rejects out-of-range thresholds, negative or all-zero weights,
// an unusable hash grid and a worker count above kMaxWorkerCount.
// Returns ok(true) or err(message).
[[nodiscard]] core::Result<bool, std::string> validate_config(const MatchConfig& config);

[[nodiscard]] std::string_view match_mode_to_string(MatchMode mode);
[[nodiscard]] std::optional<MatchMode> match_mode_from_string(std::string_view value);

[[nodiscard]] std::string_view blocking_to_string(BlockingStrategy blocking);
[[nodiscard]] std::optional<BlockingStrategy> blocking_from_string(std::string_view value);

}  // namespace spme::matching
