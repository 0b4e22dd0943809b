#include "spme/matching/price_reporter.h"

#include <algorithm>
#include <utility>

namespace spme::matching {

bool cheaper_source(const domain::RawProduct& a, const domain::RawProduct& b) {
  if (a.price.amount != b.price.amount) {
    return a.price.amount < b.price.amount;
  }
  if (a.supplier_id != b.supplier_id) {
    return a.supplier_id < b.supplier_id;
  }
  return a.product_id < b.product_id;
}

domain::PriceComparison compare_prices(const core::GroupId& group_id,
                                       std::vector<const domain::RawProduct*> members) {
  std::sort(members.begin(), members.end(),
            [](const domain::RawProduct* a, const domain::RawProduct* b) {
              return cheaper_source(*a, *b);
            });

  domain::PriceComparison comparison;
  comparison.group_id = group_id;
  if (members.empty()) {
    return comparison;
  }

  const double min_price = members.front()->price.amount;
  const double max_price = members.back()->price.amount;
  comparison.savings_absolute = max_price - min_price;
  comparison.savings_percent =
      max_price > 0.0 ? comparison.savings_absolute / max_price * 100.0 : 0.0;

  comparison.ranked_members.reserve(members.size());
  for (std::size_t i = 0; i < members.size(); ++i) {
    const auto& product = *members[i];
    comparison.ranked_members.push_back(domain::RankedMember{
        i + 1, product.product_id, product.supplier_id, product.name, product.url, product.price});
  }

  return comparison;
}

}  // namespace spme::matching
