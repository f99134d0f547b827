#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace trackq::scheduler {

/*
  Wake-up signal for idle workers.

  Workers read Generation() before looking for work and pass it to Wait();
  a Notify() in between makes Wait() return immediately, so no wake-up is
  lost. Wait() also returns after `timeout` so back-off deadlines are seen.
*/
class DispatchSignal {
 public:
  void Notify();

  uint64_t Generation() const;

  // Returns false once Shutdown() was called.
  bool Wait(uint64_t seen_generation, std::chrono::milliseconds timeout);

  void Shutdown();

  bool IsShutdown() const;

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  uint64_t                generation_ = 0;
  bool                    shutdown_   = false;
};

} // namespace trackq::scheduler
