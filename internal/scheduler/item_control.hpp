#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace trackq::scheduler {

// Ordered by strength; a request never downgrades an earlier one.
enum class StopRequest {
  None     = 0,
  Shutdown = 1, // back to pending, retry budget untouched
  Pause    = 2,
  Cancel   = 3,
  Remove   = 4, // row already deleted, abandon quietly
};

const char* ToString(StopRequest request);

/*
  Cooperative stop flag of one executing item. Checked by the executor at
  every chunk and child boundary.

  The executor seals the control inside the store write that ends its run.
  A request is accepted only before that point, so an accepted request is
  always seen by the final write.
*/
class ItemControl {
 public:
  // False if the control is already sealed.
  bool Request(StopRequest request);

  // Refuses further requests; returns the strongest one accepted so far.
  StopRequest Seal();

  StopRequest Requested() const;

  bool StopRequested() const {
    return Requested() != StopRequest::None;
  }

  // Sleeps up to `delay`; returns false early if a stop is requested.
  bool WaitFor(std::chrono::milliseconds delay);

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  StopRequest             request_ = StopRequest::None;
  bool                    sealed_  = false;
};

/*
  Controls of the items currently held by workers, keyed by item id.
  At most one control exists per id.
*/
class ControlRegistry {
 public:
  std::shared_ptr<ItemControl> Register(const std::string& id);
  void                         Release(const std::string& id);

  // False if no worker holds the id or its run is already settled.
  bool Request(const std::string& id, StopRequest request);

  // Requests a stop of every held item and of every item registered later.
  void StopAll(StopRequest request);

  std::size_t ActiveCount() const;

 private:
  mutable std::mutex                                            mutex_;
  std::unordered_map<std::string, std::shared_ptr<ItemControl>> active_;
  StopRequest                                                   sticky_ = StopRequest::None;
};

} // namespace trackq::scheduler
