#include "spme/matching/pair_scorer.h"

#include "spme/similarity/hybrid_scorer.h"
#include "spme/similarity/image_similarity.h"

#include <algorithm>
#include <system_error>
#include <thread>

namespace spme::matching {

PairOutcome score_pair(const ProductFeatures& a, const similarity::TextProfile& pa,
                       const ProductFeatures& b, const similarity::TextProfile& pb,
                       const MatchConfig& config, const double threshold) {
  PairOutcome outcome;
  auto& score = outcome.score;

  if (b.product_id < a.product_id) {
    score.product_a_id = b.product_id;
    score.product_b_id = a.product_id;
  } else {
    score.product_a_id = a.product_id;
    score.product_b_id = b.product_id;
  }

  score.text_similarity = similarity::text_similarity(pa, pb, config.text_weights);

  if (config.mode != MatchMode::kText && a.image_hash.has_value() && b.image_hash.has_value()) {
    const auto image = similarity::image_similarity(a.image_hash.value(), b.image_hash.value());
    if (image.has_value()) {
      score.image_similarity = image.value();
    } else {
      outcome.hash_mismatch =
          image.error() == similarity::ImageSimilarityError::kHashVersionMismatch;
    }
  }

  switch (config.mode) {
    case MatchMode::kText:
      score.hybrid_score = score.text_similarity;
      break;
    case MatchMode::kImage:
      score.hybrid_score = score.image_similarity.value_or(0.0);
      break;
    case MatchMode::kHybrid:
      score.hybrid_score = similarity::hybrid_score(score.text_similarity, score.image_similarity,
                                                    config.hybrid_weights);
      break;
  }

  score.is_match = score.hybrid_score >= threshold;
  return outcome;
}

std::size_t resolve_worker_count(const MatchConfig& config, const std::size_t pair_count) {
  if (pair_count == 0 || pair_count < config.parallel_threshold) {
    return 1;
  }
  std::size_t workers = config.worker_count;
  if (workers == 0) {
    workers = std::max(1u, std::thread::hardware_concurrency());
  }
  return std::clamp<std::size_t>(workers, 1, std::min(pair_count, kMaxWorkerCount));
}

std::vector<PairOutcome> score_candidates(const CandidateSet& candidates,
                                          const std::vector<ProductFeatures>& features,
                                          const std::vector<similarity::TextProfile>& profiles,
                                          const MatchConfig& config, const double threshold) {
  const std::size_t total = candidates.pairs.size();
  std::vector<PairOutcome> outcomes(total);

  const auto score_slice = [&](const std::size_t begin, const std::size_t end) {
    for (std::size_t k = begin; k < end; ++k) {
      const auto& pair = candidates.pairs[k];
      outcomes[k] = score_pair(features[pair.first], profiles[pair.first], features[pair.second],
                               profiles[pair.second], config, threshold);
    }
  };

  const std::size_t worker_count = resolve_worker_count(config, total);
  if (worker_count <= 1) {
    score_slice(0, total);
    return outcomes;
  }

  const std::size_t chunk = (total + worker_count - 1) / worker_count;
  std::vector<std::thread> workers;
  workers.reserve(worker_count);
  std::size_t dispatched = 0;  // pairs [0, dispatched) belong to started threads
  for (std::size_t w = 0; w < worker_count; ++w) {
    const std::size_t begin = w * chunk;
    const std::size_t end = std::min(total, begin + chunk);
    if (begin >= end) {
      break;
    }
    try {
      workers.emplace_back(score_slice, begin, end);
    } catch (const std::system_error&) {
      // The OS refused another thread; the calling thread takes the rest.
      break;
    }
    dispatched = end;
  }
  score_slice(dispatched, total);
  for (auto& worker : workers) {
    worker.join();
  }

  return outcomes;
}

}  // namespace spme::matching
