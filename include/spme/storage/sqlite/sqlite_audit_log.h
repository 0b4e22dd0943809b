#pragma once

#include "spme/storage/audit_log.h"
#include "spme/storage/sqlite/sqlite_db.h"

#include <map>
#include <memory>
#include <mutex>

namespace spme::storage::sqlite {

// SqliteAuditLog implements IAuditLog with SQLite backend.
// Maintains append-only log with deterministic ordering via idx column.
// Thread-safe append operations using mutex for idx counter.
// Requires schema v1.
class SqliteAuditLog final : public IAuditLog {
 public:
  explicit SqliteAuditLog(std::shared_ptr<SqliteDb> db);

  void append(const AuditEvent& event) override;
  [[nodiscard]] std::vector<AuditEvent> query(const std::string& trace_id) const override;
  [[nodiscard]] std::vector<std::string> list_trace_ids() const override;

 private:
  std::shared_ptr<SqliteDb> db_;

  mutable std::mutex mutex_;
  std::map<std::string, int> trace_indices_;

  int next_index(const std::string& trace_id);
};

}  // namespace spme::storage::sqlite
