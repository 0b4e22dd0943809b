#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace spme::domain {

// Recoverable data-quality conditions. None of them aborts a run.
enum class WarningKind {
  kHashVersionMismatch,          // two image hashes of incompatible length/algorithm
  kCurrencyMismatchWithinGroup,  // group members priced in different currencies
  kBlockingPrunedPairs,          // blocking skipped cross-supplier pairs
  kImageUnreadable,              // an image could not be read or decoded; product has no image signal
  kUntaggedImageHash,            // a supplied hash has no algorithm tag; compared by length only
};

struct DataQualityWarning {
  WarningKind kind{WarningKind::kHashVersionMismatch};
  std::string message;
  std::vector<std::string> refs;  // product ids or group id involved
};

[[nodiscard]] std::string_view warning_kind_to_string(WarningKind kind);
[[nodiscard]] std::optional<WarningKind> warning_kind_from_string(std::string_view value);

}  // namespace spme::domain
