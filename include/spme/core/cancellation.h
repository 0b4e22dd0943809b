#pragma once

#include <atomic>

namespace spme::core {

// CancellationToken is a cooperative stop flag shared between the thread that
// drives a matching run and whoever may want to abort it.
// Cancellation granularity is the whole run: the engine only observes the flag
// at phase boundaries and never returns partial groups.
class CancellationToken {
 public:
  CancellationToken() = default;

  CancellationToken(const CancellationToken&) = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  void cancel() { cancelled_.store(true, std::memory_order_release); }
  [[nodiscard]] bool is_cancelled() const { return cancelled_.load(std::memory_order_acquire); }

 private:
  std::atomic<bool> cancelled_{false};
};

}  // namespace spme::core
