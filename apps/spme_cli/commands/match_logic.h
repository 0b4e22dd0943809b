#pragma once

#include "spme/app/json_codec.h"
#include "spme/core/clock.h"
#include "spme/core/id_generator.h"
#include "spme/core/services.h"
#include "spme/matching/match_config.h"

#include <iosfwd>
#include <string>

struct MatchRunOptions {
  spme::matching::MatchConfig config;
  spme::app::ResultJsonOptions output;
  bool show_audit{false};
};

// run_match_batch decodes a product batch, runs the matching pipeline and
// writes the result JSON to out (errors as {"error": {...}} to out as well).
// Diagnostics and the optional audit trail go to err.
// Takes only interface types so it can run against in-memory or SQLite services.
// Returns the process exit code: 0 on success, 1 on any failure.
int run_match_batch(const std::string& batch_text, const MatchRunOptions& options,
                    spme::core::Services& services, spme::core::IIdGenerator& id_gen,
                    spme::core::IClock& clock, std::ostream& out, std::ostream& err);
