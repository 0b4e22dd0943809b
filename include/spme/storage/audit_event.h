#pragma once

#include <string>
#include <vector>

namespace spme::storage {

// AuditEvent is one structured log record of a matching run.
// payload is a JSON document; refs lists the product or group ids involved.
struct AuditEvent {
  std::string event_id;
  std::string trace_id;
  std::string event_type;
  std::string payload;
  std::string created_at;
  std::vector<std::string> refs;
};

}  // namespace spme::storage
