#pragma once

#include "spme/domain/pair_score.h"
#include "spme/matching/candidate_generator.h"
#include "spme/matching/match_config.h"
#include "spme/matching/product_features.h"
#include "spme/similarity/text_similarity.h"

#include <cstddef>
#include <vector>

namespace spme::matching {

// PairOutcome is one scored candidate. hash_mismatch records that both products
// carried hashes that could not be compared (different length or algorithm).
struct PairOutcome {
  domain::PairScore score;
  bool hash_mismatch{false};
};

// score_pair is pure: it reads the two feature records and the config only.
// In kText mode image similarity is not computed; in kImage mode the decisive
// score is image similarity, 0 when it is unavailable.
[[nodiscard]] PairOutcome score_pair(const ProductFeatures& a, const similarity::TextProfile& pa,
                                     const ProductFeatures& b, const similarity::TextProfile& pb,
                                     const MatchConfig& config, double threshold);

// resolve_worker_count returns how many threads score_candidates will use:
// 1 below the parallel threshold, otherwise worker_count (0 = hardware
// concurrency), never more than one per pair or kMaxWorkerCount.
[[nodiscard]] std::size_t resolve_worker_count(const MatchConfig& config, std::size_t pair_count);

// score_candidates scores every pair of the set. Workers own contiguous slices
// of a pre-sized output vector, so results are in candidate order regardless
// of the worker count. If a thread cannot be started, the calling thread scores
// the slices that were not handed out.
[[nodiscard]] std::vector<PairOutcome> score_candidates(
    const CandidateSet& candidates, const std::vector<ProductFeatures>& features,
    const std::vector<similarity::TextProfile>& profiles, const MatchConfig& config,
    double threshold);

}  // namespace spme::matching
