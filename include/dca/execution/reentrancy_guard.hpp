#pragma once

#include <atomic>
#include <mutex>
#include <thread>

namespace dca::execution {

/// Serializes entry points and recognizes a call that re-enters from the
/// thread already inside one (a collaborator calling back mid-transaction).
///
/// Calls from other threads wait on the mutex instead.
class reentrancy_guard final {
 public:
  class scope final {
   public:
    explicit scope(reentrancy_guard& guard);
    ~scope();

    scope(const scope&) = delete;
    scope& operator=(const scope&) = delete;
    scope(scope&&) = delete;
    scope& operator=(scope&&) = delete;

   private:
    reentrancy_guard& guard_;
    std::unique_lock<std::mutex> lock_;
  };

  bool entered_by_current_thread() const;

  /// Lock for read accessors: empty when the current thread already holds
  /// the guard, so reads made from a collaborator callback do not deadlock.
  std::unique_lock<std::mutex> read_lock() const;

 private:
  mutable std::mutex mutex_;
  std::atomic<std::thread::id> owner_{};
};

}  // namespace dca::execution
