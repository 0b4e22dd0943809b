#include "spme/domain/matching_group.h"

namespace spme::domain {

std::string_view group_status_to_string(const GroupStatus status) {
  switch (status) {
    case GroupStatus::kUnmatched:
      return "unmatched";
    case GroupStatus::kAutoMatched:
      return "auto_matched";
    case GroupStatus::kNeedsReview:
      return "needs_review";
  }
  return "unknown";
}

std::optional<GroupStatus> group_status_from_string(const std::string_view value) {
  if (value == "unmatched") {
    return GroupStatus::kUnmatched;
  }
  if (value == "auto_matched") {
    return GroupStatus::kAutoMatched;
  }
  if (value == "needs_review") {
    return GroupStatus::kNeedsReview;
  }
  return std::nullopt;
}

}  // namespace spme::domain
