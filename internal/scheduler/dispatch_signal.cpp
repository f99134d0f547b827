#include "dispatch_signal.hpp"

namespace trackq::scheduler {

void DispatchSignal::Notify() {
  {
    std::lock_guard lock(mutex_);
    ++generation_;
  }
  cv_.notify_all();
}

uint64_t DispatchSignal::Generation() const {
  std::lock_guard lock(mutex_);
  return generation_;
}

bool DispatchSignal::Wait(uint64_t seen_generation, std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);

  cv_.wait_for(lock, timeout, [&] { return shutdown_ || generation_ != seen_generation; });

  return !shutdown_;
}

void DispatchSignal::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

bool DispatchSignal::IsShutdown() const {
  std::lock_guard lock(mutex_);
  return shutdown_;
}

} // namespace trackq::scheduler
