#pragma once

#include "spme/storage/audit_log.h"
#include "spme/storage/feature_cache.h"

namespace spme::core {

// Services is a composition root that bundles the run-time collaborators of the
// application layer. It holds references (not ownership); the CLI or test that
// builds it owns the concrete instances and their lifetimes.
struct Services {
  storage::IAuditLog& audit_log;          // NOLINT(readability-identifier-naming)
  storage::IFeatureCache& feature_cache;  // NOLINT(readability-identifier-naming)

  Services(storage::IAuditLog& audit_log, storage::IFeatureCache& feature_cache)
      : audit_log(audit_log), feature_cache(feature_cache) {}

  ~Services() = default;

  // Prevent copying and moving to avoid accidental lifetime issues
  Services(const Services&) = delete;
  Services& operator=(const Services&) = delete;
  Services(Services&&) = delete;
  Services& operator=(Services&&) = delete;
};

}  // namespace spme::core
