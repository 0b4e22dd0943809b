#include "spme/matching/group_summarizer.h"

#include "spme/core/utf8.h"
#include "spme/matching/price_reporter.h"
#include "spme/similarity/edit_distance.h"

#include <algorithm>
#include <map>
#include <set>
#include <string>
#include <utility>

namespace spme::matching {

core::GroupId group_id_for(const std::size_t ordinal) {
  return core::GroupId{"group-" + std::to_string(ordinal + 1)};
}

std::size_t select_representative(const std::vector<std::size_t>& indices,
                                  const std::vector<domain::RawProduct>& products,
                                  const std::vector<ProductFeatures>& features) {
  std::vector<std::u32string> names;
  names.reserve(indices.size());
  for (const std::size_t i : indices) {
    names.push_back(core::decode_utf8(features[i].normalized_name));
  }

  std::vector<std::size_t> totals(indices.size(), 0);
  for (std::size_t x = 0; x < names.size(); ++x) {
    for (std::size_t y = x + 1; y < names.size(); ++y) {
      const std::size_t d = similarity::levenshtein_distance(names[x], names[y]);
      totals[x] += d;
      totals[y] += d;
    }
  }

  std::size_t best = 0;
  for (std::size_t x = 1; x < indices.size(); ++x) {
    if (totals[x] != totals[best]) {
      if (totals[x] < totals[best]) {
        best = x;
      }
      continue;
    }
    if (names[x].size() != names[best].size()) {
      if (names[x].size() > names[best].size()) {
        best = x;
      }
      continue;
    }
    if (products[indices[x]].product_id < products[indices[best]].product_id) {
      best = x;
    }
  }
  return best;
}

domain::MatchingGroup summarize_group(const ProductCluster& cluster, const std::size_t ordinal,
                                      const std::vector<domain::RawProduct>& products,
                                      const std::vector<ProductFeatures>& features,
                                      const std::vector<domain::PairScore>& internal_scores,
                                      const double auto_confirm_threshold) {
  domain::MatchingGroup group;
  group.group_id = group_id_for(ordinal);

  const auto& indices = cluster.member_indices;
  if (indices.empty()) {
    return group;
  }

  std::set<std::string> currencies;
  double total = 0.0;
  std::size_t best = indices.front();
  group.min_price = products[best].price.amount;
  group.max_price = products[best].price.amount;

  for (const std::size_t i : indices) {
    const auto& product = products[i];
    group.members.push_back(product.product_id);
    currencies.insert(product.price.currency);
    total += product.price.amount;
    group.min_price = std::min(group.min_price, product.price.amount);
    group.max_price = std::max(group.max_price, product.price.amount);
    if (cheaper_source(product, products[best])) {
      best = i;
    }
  }
  group.avg_price = total / static_cast<double>(indices.size());
  group.best_member_id = products[best].product_id;
  group.best_supplier_id = products[best].supplier_id;

  if (currencies.size() == 1) {
    group.currency = *currencies.begin();
  } else {
    std::string listed;
    for (const auto& currency : currencies) {
      listed += listed.empty() ? currency : ", " + currency;
    }
    domain::DataQualityWarning warning;
    warning.kind = domain::WarningKind::kCurrencyMismatchWithinGroup;
    warning.message = group.group_id.value + " mixes currencies " + listed +
                      "; prices are aggregated without conversion";
    warning.refs.push_back(group.group_id.value);
    for (const auto& id : group.members) {
      warning.refs.push_back(id.value);
    }
    group.warnings.push_back(std::move(warning));
  }

  const std::size_t rep = indices[select_representative(indices, products, features)];
  group.representative_name = products[rep].name;
  group.representative_product_id = products[rep].product_id;

  group.scored_pair_count = internal_scores.size();
  if (indices.size() == 1) {
    group.confidence_score = 1.0;
    group.status = domain::GroupStatus::kUnmatched;
  } else {
    double sum = 0.0;
    for (const auto& score : internal_scores) {
      sum += score.hybrid_score;
    }
    group.confidence_score =
        internal_scores.empty() ? 0.0 : sum / static_cast<double>(internal_scores.size());
    group.status = group.confidence_score >= auto_confirm_threshold
                       ? domain::GroupStatus::kAutoMatched
                       : domain::GroupStatus::kNeedsReview;
  }

  std::vector<const domain::RawProduct*> listings;
  listings.reserve(indices.size());
  for (const std::size_t i : indices) {
    listings.push_back(&products[i]);
  }
  group.comparison = compare_prices(group.group_id, std::move(listings));
  return group;
}

std::vector<domain::MatchingGroup> summarize_groups(
    const std::vector<ProductCluster>& clusters, const std::vector<domain::RawProduct>& products,
    const std::vector<ProductFeatures>& features, const std::vector<domain::PairScore>& scores,
    const double auto_confirm_threshold) {
  std::map<std::string, std::size_t> cluster_by_id;
  for (std::size_t c = 0; c < clusters.size(); ++c) {
    for (const std::size_t i : clusters[c].member_indices) {
      cluster_by_id.emplace(products[i].product_id.value, c);
    }
  }

  std::vector<std::vector<domain::PairScore>> internal(clusters.size());
  for (const auto& score : scores) {
    const auto a = cluster_by_id.find(score.product_a_id.value);
    const auto b = cluster_by_id.find(score.product_b_id.value);
    if (a != cluster_by_id.end() && b != cluster_by_id.end() && a->second == b->second) {
      internal[a->second].push_back(score);
    }
  }

  std::vector<domain::MatchingGroup> groups;
  groups.reserve(clusters.size());
  for (std::size_t c = 0; c < clusters.size(); ++c) {
    groups.push_back(
        summarize_group(clusters[c], c, products, features, internal[c], auto_confirm_threshold));
  }
  return groups;
}

}  // namespace spme::matching
