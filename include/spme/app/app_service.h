#pragma once

#include "spme/core/cancellation.h"
#include "spme/core/clock.h"
#include "spme/core/id_generator.h"
#include "spme/core/services.h"
#include "spme/domain/raw_product.h"
#include "spme/matching/engine.h"
#include "spme/matching/match_config.h"
#include "spme/storage/audit_event.h"

#include <optional>
#include <string>
#include <vector>

namespace spme::app {

// ────────────────────────────────────────────────────────────────
// Matching Pipeline
// ────────────────────────────────────────────────────────────────

struct MatchingPipelineRequest {
  std::vector<domain::RawProduct> products;  // NOLINT(readability-identifier-naming)
  matching::MatchConfig config;              // NOLINT(readability-identifier-naming)

  // Optional trace_id (if not provided, will be generated)
  std::optional<std::string> trace_id;  // NOLINT(readability-identifier-naming)

  // Optional cooperative stop flag, owned by the caller
  const core::CancellationToken* cancellation{nullptr};  // NOLINT(readability-identifier-naming)

  // When false, services.feature_cache is neither read nor written
  bool use_feature_cache{true};  // NOLINT(readability-identifier-naming)
};

// Exactly one of result / error is set.
struct MatchingPipelineResponse {
  std::string trace_id;                           // NOLINT(readability-identifier-naming)
  std::optional<matching::MatchRunResult> result;  // NOLINT(readability-identifier-naming)
  std::optional<matching::MatchError> error;       // NOLINT(readability-identifier-naming)

  [[nodiscard]] bool ok() const { return result.has_value(); }
};

// Run a full matching batch through the engine and record it in the audit log.
// Emits audit events:
//   RunStarted
//   success:   CandidatesGenerated, DataQualityWarning (one per warning), GroupsBuilt,
//              RunCompleted
//   rejected:  InputRejected (malformed record), RunFailed
//   cancelled: RunCancelled
[[nodiscard]] MatchingPipelineResponse run_matching_pipeline(const MatchingPipelineRequest& req,
                                                             core::Services& services,
                                                             core::IIdGenerator& id_gen,
                                                             core::IClock& clock);

// ────────────────────────────────────────────────────────────────
// Audit Trace
// ────────────────────────────────────────────────────────────────

// Fetch all audit events for a given trace_id
[[nodiscard]] std::vector<storage::AuditEvent> fetch_audit_trace(const std::string& trace_id,
                                                                 core::Services& services);

}  // namespace spme::app
