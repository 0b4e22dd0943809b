#pragma once

#include "spme/core/cancellation.h"
#include "spme/core/result.h"
#include "spme/domain/matching_group.h"
#include "spme/domain/pair_score.h"
#include "spme/domain/raw_product.h"
#include "spme/domain/warning.h"
#include "spme/matching/match_config.h"
#include "spme/matching/product_features.h"
#include "spme/storage/feature_cache.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace spme::matching {

enum class MatchErrorKind {
  kMalformedInput,  // a record violates the input contract; nothing was scored
  kInvalidConfig,   // thresholds or weights out of range
  kCancelled,       // the cancellation token fired; no partial groups are returned
};

struct MatchError {
  MatchErrorKind kind{MatchErrorKind::kMalformedInput};
  std::string message;
  std::optional<std::size_t> record_index;  // set for kMalformedInput
  std::string product_id;                   // offending record's id when known
};

[[nodiscard]] std::string_view match_error_kind_to_string(MatchErrorKind kind);

// RunStats reports the work done by a run; used for audit payloads and the CLI summary.
struct RunStats {
  std::size_t product_count{0};
  std::size_t naive_pair_count{0};
  std::size_t candidate_pair_count{0};
  std::size_t pruned_pair_count{0};
  std::size_t matched_pair_count{0};
  std::size_t group_count{0};
  std::size_t multi_member_group_count{0};
  std::size_t worker_count{1};
  std::size_t name_cache_hits{0};
  std::size_t hash_cache_hits{0};
  std::size_t hashes_computed{0};
};

// MatchRunResult is the complete outcome of one batch run.
// groups cover every input product exactly once, in group_id order.
// warnings lists run-level warnings followed by every group's warnings.
struct MatchRunResult {
  double threshold{0.0};
  std::vector<domain::MatchingGroup> groups;
  std::vector<domain::PairScore> pair_scores;
  std::vector<ProductFeatures> features;  // input order
  std::vector<domain::DataQualityWarning> warnings;
  RunStats stats;
};

// MatchingEngine runs the whole pipeline over one batch:
//   validate -> derive features -> candidates -> score -> cluster -> summarize
// A run is a pure function of (products, config) apart from feature-cache I/O:
// identical input yields identical output for any worker count.
class MatchingEngine {
 public:
  explicit MatchingEngine(MatchConfig config = MatchConfig{});

  [[nodiscard]] const MatchConfig& config() const { return config_; }

  // run never throws for bad data; errors come back as MatchError.
  // token is checked after candidate generation and after scoring.
  // cache, when given, is consulted before normalizing names and hashing images
  // and filled with whatever had to be computed.
  [[nodiscard]] core::Result<MatchRunResult, MatchError> run(
      const std::vector<domain::RawProduct>& products,
      const core::CancellationToken* token = nullptr,
      storage::IFeatureCache* cache = nullptr) const;

 private:
  MatchConfig config_;
};

}  // namespace spme::matching
