#include "item_control.hpp"

#include <stdexcept>

namespace trackq::scheduler {

const char* ToString(StopRequest request) {
  switch (request) {
    case StopRequest::None:
      return "none";
    case StopRequest::Shutdown:
      return "shutdown";
    case StopRequest::Pause:
      return "pause";
    case StopRequest::Cancel:
      return "cancel";
    case StopRequest::Remove:
      return "remove";
  }
  return "unknown";
}

bool ItemControl::Request(StopRequest request) {
  {
    std::lock_guard lock(mutex_);
    if (sealed_) {
      return false;
    }
    if (static_cast<int>(request) > static_cast<int>(request_)) {
      request_ = request;
    }
  }
  cv_.notify_all();
  return true;
}

StopRequest ItemControl::Seal() {
  std::lock_guard lock(mutex_);
  sealed_ = true;
  return request_;
}

StopRequest ItemControl::Requested() const {
  std::lock_guard lock(mutex_);
  return request_;
}

bool ItemControl::WaitFor(std::chrono::milliseconds delay) {
  std::unique_lock lock(mutex_);
  return !cv_.wait_for(lock, delay, [&] { return request_ != StopRequest::None; });
}

std::shared_ptr<ItemControl> ControlRegistry::Register(const std::string& id) {
  std::lock_guard lock(mutex_);
  auto [it, inserted] = active_.emplace(id, std::make_shared<ItemControl>());
  if (!inserted) {
    throw std::logic_error("item already held by a worker: " + id);
  }
  if (sticky_ != StopRequest::None) {
    it->second->Request(sticky_);
  }
  return it->second;
}

void ControlRegistry::Release(const std::string& id) {
  std::lock_guard lock(mutex_);
  active_.erase(id);
}

bool ControlRegistry::Request(const std::string& id, StopRequest request) {
  std::shared_ptr<ItemControl> control;
  {
    std::lock_guard lock(mutex_);
    auto            it = active_.find(id);
    if (it == active_.end()) return false;
    control = it->second;
  }
  return control->Request(request);
}

void ControlRegistry::StopAll(StopRequest request) {
  std::lock_guard lock(mutex_);
  sticky_ = request;
  for (auto& [_, control] : active_) {
    control->Request(request);
  }
}

std::size_t ControlRegistry::ActiveCount() const {
  std::lock_guard lock(mutex_);
  return active_.size();
}

} // namespace trackq::scheduler
