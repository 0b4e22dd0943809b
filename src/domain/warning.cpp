#include "spme/domain/warning.h"

namespace spme::domain {

std::string_view warning_kind_to_string(const WarningKind kind) {
  switch (kind) {
    case WarningKind::kHashVersionMismatch:
      return "hash_version_mismatch";
    case WarningKind::kCurrencyMismatchWithinGroup:
      return "currency_mismatch_within_group";
    case WarningKind::kBlockingPrunedPairs:
      return "blocking_pruned_pairs";
    case WarningKind::kImageUnreadable:
      return "image_unreadable";
    case WarningKind::kUntaggedImageHash:
      return "untagged_image_hash";
  }
  return "unknown";
}

std::optional<WarningKind> warning_kind_from_string(const std::string_view value) {
  if (value == "hash_version_mismatch") {
    return WarningKind::kHashVersionMismatch;
  }
  if (value == "currency_mismatch_within_group") {
    return WarningKind::kCurrencyMismatchWithinGroup;
  }
  if (value == "blocking_pruned_pairs") {
    return WarningKind::kBlockingPrunedPairs;
  }
  if (value == "image_unreadable") {
    return WarningKind::kImageUnreadable;
  }
  if (value == "untagged_image_hash") {
    return WarningKind::kUntaggedImageHash;
  }
  return std::nullopt;
}

}  // namespace spme::domain
