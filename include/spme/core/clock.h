#pragma once

#include <string>

namespace spme::core {

// IClock supplies timestamps for audit events and run records.
// Injected so that tests and the CLI demo can pin time and produce byte-stable output.
class IClock {
 public:
  virtual ~IClock() = default;

  // ISO 8601 UTC timestamp, e.g. "2026-01-01T00:00:00Z". Never empty.
  virtual std::string now_iso8601() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

class SystemClock final : public IClock {
 public:
  std::string now_iso8601() override;
};

// FixedClock always reports the timestamp it was constructed with.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(std::string fixed_time) : fixed_time_(std::move(fixed_time)) {}

  std::string now_iso8601() override { return fixed_time_; }

 private:
  std::string fixed_time_;
};

}  // namespace spme::core
