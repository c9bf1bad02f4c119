#pragma once

#include <atomic>

namespace aux
{
/// One-shot cooperative stop request.
///
/// Set at most once (typically from a signal handler) and polled by repeating
/// operations before they re-arm. Reads never block and never take a lock.
class CancellationFlag
{
  static_assert(std::atomic<bool>::is_always_lock_free);

  std::atomic<bool> m_requested {false};

public:
  /// Returns true only for the call that actually set the flag.
  bool request() noexcept
  {
    return !m_requested.exchange(true, std::memory_order_relaxed);
  }

  bool is_set() const noexcept
  {
    return m_requested.load(std::memory_order_relaxed);
  }
};
}  // namespace aux
