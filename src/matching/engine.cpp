#include "spme/matching/engine.h"

#include "spme/core/normalization.h"
#include "spme/matching/candidate_generator.h"
#include "spme/matching/cluster_builder.h"
#include "spme/matching/group_summarizer.h"
#include "spme/matching/pair_scorer.h"
#include "spme/similarity/perceptual_hasher.h"
#include "spme/similarity/text_similarity.h"

#include <set>
#include <utility>

namespace spme::matching {

namespace {

using RunResult = core::Result<MatchRunResult, MatchError>;

bool cancelled(const core::CancellationToken* token) {
  return token != nullptr && token->is_cancelled();
}

RunResult cancelled_error() {
  return RunResult::err(MatchError{MatchErrorKind::kCancelled, "run cancelled", std::nullopt, ""});
}

RunResult malformed(const std::size_t index, const domain::RawProduct& product,
                    const std::string& message) {
  return RunResult::err(MatchError{MatchErrorKind::kMalformedInput,
                                   "record " + std::to_string(index) + ": " + message, index,
                                   product.product_id.value});
}

// validate_batch checks every record and id uniqueness before any work is done.
std::optional<RunResult> validate_batch(const std::vector<domain::RawProduct>& products) {
  std::set<std::string> seen;
  for (std::size_t i = 0; i < products.size(); ++i) {
    const auto check = products[i].validate();
    if (!check.has_value()) {
      return malformed(i, products[i], check.error());
    }
    if (!seen.insert(products[i].product_id.value).second) {
      return malformed(i, products[i], "duplicate product_id '" + products[i].product_id.value + "'");
    }
  }
  return std::nullopt;
}

// hash_image resolves an image reference to a perceptual hash, consulting and
// filling the feature cache keyed by the encoded content.
core::Result<bool, std::string> hash_image(const domain::ImageRef& image,
                                           const similarity::IPerceptualHasher& hasher,
                                           storage::IFeatureCache* cache, ProductFeatures& features,
                                           RunStats& stats) {
  using R = core::Result<bool, std::string>;

  auto bytes = similarity::load_image_bytes(image);
  if (!bytes.has_value()) {
    return R::err(bytes.error());
  }

  const std::string key = similarity::image_cache_key(bytes.value(), hasher.algorithm());
  auto cached = cache != nullptr ? cache->get_image_hash(key) : std::nullopt;
  if (cached.has_value()) {
    features.image_hash = std::move(cached);
    features.hash_from_cache = true;
    ++stats.hash_cache_hits;
    return R::ok(true);
  }

  const auto decoded = similarity::decode_image(bytes.value());
  if (!decoded.has_value()) {
    return R::err(decoded.error());
  }
  auto hashed = hasher.hash(decoded.value());
  if (!hashed.has_value()) {
    return R::err(hashed.error());
  }

  features.image_hash = hashed.take_value();
  ++stats.hashes_computed;
  if (cache != nullptr) {
    cache->put_image_hash(key, *features.image_hash);
  }
  return R::ok(true);
}

}  // namespace

std::string_view match_error_kind_to_string(const MatchErrorKind kind) {
  switch (kind) {
    case MatchErrorKind::kMalformedInput:
      return "malformed_input";
    case MatchErrorKind::kInvalidConfig:
      return "invalid_config";
    case MatchErrorKind::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

MatchingEngine::MatchingEngine(MatchConfig config) : config_(std::move(config)) {}

RunResult MatchingEngine::run(const std::vector<domain::RawProduct>& products,
                              const core::CancellationToken* token,
                              storage::IFeatureCache* cache) const {
  const auto config_check = validate_config(config_);
  if (!config_check.has_value()) {
    return RunResult::err(
        MatchError{MatchErrorKind::kInvalidConfig, config_check.error(), std::nullopt, ""});
  }
  if (auto invalid = validate_batch(products); invalid.has_value()) {
    return std::move(invalid).value();
  }

  MatchRunResult result;
  result.threshold = config_.effective_threshold();
  result.stats.product_count = products.size();

  // Feature extraction: normalized names and usable perceptual hashes.
  const auto hasher = similarity::make_hasher(config_.hash_algorithm, config_.hash_grid);
  const bool wants_images = config_.mode != MatchMode::kText;
  result.features.reserve(products.size());

  for (std::size_t i = 0; i < products.size(); ++i) {
    const auto& product = products[i];
    ProductFeatures features;
    features.product_id = product.product_id;

    if (product.normalized_name.has_value()) {
      features.normalized_name = product.normalized_name.value();
    } else {
      const std::string key = core::cache_key_for_name(product.name, config_.normalizer);
      auto cached = cache != nullptr ? cache->get_normalized_name(key) : std::nullopt;
      if (cached.has_value()) {
        features.normalized_name = std::move(cached).value();
        features.name_from_cache = true;
        ++result.stats.name_cache_hits;
      } else {
        features.normalized_name = core::normalize_product_name(product.name, config_.normalizer);
        if (cache != nullptr) {
          cache->put_normalized_name(key, features.normalized_name);
        }
      }
    }

    if (wants_images) {
      if (product.image_hash.has_value() && !product.image_hash->empty()) {
        features.image_hash = product.image_hash;
        if (product.image_hash->algorithm.empty()) {
          domain::DataQualityWarning warning;
          warning.kind = domain::WarningKind::kUntaggedImageHash;
          warning.message = "image hash of product '" + product.product_id.value +
                            "' has no algorithm tag and is compared by length only";
          warning.refs = {product.product_id.value};
          result.warnings.push_back(std::move(warning));
        }
      } else if (product.image.has_value()) {
        auto hashed = hash_image(*product.image, *hasher, cache, features, result.stats);
        if (!hashed.has_value()) {
          domain::DataQualityWarning warning;
          warning.kind = domain::WarningKind::kImageUnreadable;
          warning.message = "image of product '" + product.product_id.value +
                            "' was not used: " + hashed.error();
          warning.refs = {product.product_id.value};
          result.warnings.push_back(std::move(warning));
        }
      }
    }

    result.features.push_back(std::move(features));
  }

  std::vector<similarity::TextProfile> profiles;
  profiles.reserve(result.features.size());
  for (const auto& features : result.features) {
    profiles.push_back(similarity::make_text_profile(features.normalized_name));
  }

  const CandidateSet candidates = generate_candidates(products, result.features, config_.blocking,
                                                      config_.mode == MatchMode::kImage);
  result.stats.naive_pair_count = candidates.naive_pair_count;
  result.stats.candidate_pair_count = candidates.pairs.size();
  result.stats.pruned_pair_count = candidates.pruned_pair_count;

  if (candidates.pruned_pair_count > 0) {
    domain::DataQualityWarning warning;
    warning.kind = domain::WarningKind::kBlockingPrunedPairs;
    warning.message = std::string("blocking '") +
                      std::string(blocking_to_string(config_.blocking)) + "' skipped " +
                      std::to_string(candidates.pruned_pair_count) + " of " +
                      std::to_string(candidates.naive_pair_count) + " cross-supplier pairs";
    result.warnings.push_back(std::move(warning));
  }

  if (cancelled(token)) {
    return cancelled_error();
  }

  result.stats.worker_count = resolve_worker_count(config_, candidates.pairs.size());
  auto outcomes =
      score_candidates(candidates, result.features, profiles, config_, result.threshold);

  if (cancelled(token)) {
    return cancelled_error();
  }

  result.pair_scores.reserve(outcomes.size());
  for (auto& outcome : outcomes) {
    if (outcome.hash_mismatch) {
      domain::DataQualityWarning warning;
      warning.kind = domain::WarningKind::kHashVersionMismatch;
      warning.message = "image hashes of " + outcome.score.product_a_id.value + " and " +
                        outcome.score.product_b_id.value +
                        " are not comparable; scored without image similarity";
      warning.refs = {outcome.score.product_a_id.value, outcome.score.product_b_id.value};
      result.warnings.push_back(std::move(warning));
    }
    if (outcome.score.is_match) {
      ++result.stats.matched_pair_count;
    }
    result.pair_scores.push_back(std::move(outcome.score));
  }

  const auto clusters = build_groups(products, result.pair_scores, result.threshold);
  result.groups = summarize_groups(clusters, products, result.features, result.pair_scores,
                                   config_.auto_confirm_threshold);

  result.stats.group_count = result.groups.size();
  for (const auto& group : result.groups) {
    if (group.members.size() > 1) {
      ++result.stats.multi_member_group_count;
    }
    result.warnings.insert(result.warnings.end(), group.warnings.begin(), group.warnings.end());
  }

  return RunResult::ok(std::move(result));
}

}  // namespace spme::matching
