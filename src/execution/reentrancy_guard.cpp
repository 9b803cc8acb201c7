#include <dca/execution/reentrancy_guard.hpp>

namespace dca::execution {

reentrancy_guard::scope::scope(reentrancy_guard& guard)
    : guard_{guard}, lock_{guard.mutex_} {
  guard_.owner_.store(std::this_thread::get_id());
}

reentrancy_guard::scope::~scope() {
  guard_.owner_.store(std::thread::id{});
}

bool reentrancy_guard::entered_by_current_thread() const {
  return owner_.load() == std::this_thread::get_id();
}

std::unique_lock<std::mutex> reentrancy_guard::read_lock() const {
  if (entered_by_current_thread()) {
    return {};
  }
  return std::unique_lock<std::mutex>{mutex_};
}

}  // namespace dca::execution
