#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

#include "internal/scheduler/dispatch_signal.hpp"
#include "internal/scheduler/item_control.hpp"

namespace {

using trackq::scheduler::ControlRegistry;
using trackq::scheduler::DispatchSignal;
using trackq::scheduler::ItemControl;
using trackq::scheduler::StopRequest;

void TestRequestsNeverDowngrade() {
  ItemControl control;
  assert(!control.StopRequested());

  control.Request(StopRequest::Pause);
  assert(control.Requested() == StopRequest::Pause);

  control.Request(StopRequest::Shutdown);
  assert(control.Requested() == StopRequest::Pause);

  control.Request(StopRequest::Remove);
  control.Request(StopRequest::Cancel);
  assert(control.Requested() == StopRequest::Remove);
}

void TestWaitForWakesOnRequest() {
  ItemControl control;
  assert(control.WaitFor(std::chrono::milliseconds(1)));

  std::thread requester([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    control.Request(StopRequest::Cancel);
  });

  const auto start = std::chrono::steady_clock::now();
  assert(!control.WaitFor(std::chrono::seconds(30)));
  assert(std::chrono::steady_clock::now() - start < std::chrono::seconds(10));
  requester.join();
}

void TestRegistryTracksHeldItems() {
  ControlRegistry registry;
  assert(!registry.Request("t1", StopRequest::Pause));

  auto control = registry.Register("t1");
  assert(registry.ActiveCount() == 1);

  bool duplicate = false;
  try {
    registry.Register("t1");
  } catch (const std::logic_error&) {
    duplicate = true;
  }
  assert(duplicate);

  assert(registry.Request("t1", StopRequest::Pause));
  assert(control->Requested() == StopRequest::Pause);

  registry.Release("t1");
  assert(registry.ActiveCount() == 0);
  assert(!registry.Request("t1", StopRequest::Cancel));
}

void TestSealedControlRefusesRequests() {
  ControlRegistry registry;
  auto            control = registry.Register("t1");

  assert(registry.Request("t1", StopRequest::Pause));
  assert(control->Seal() == StopRequest::Pause);

  // settled but not yet released: the caller must re-read the row
  assert(!registry.Request("t1", StopRequest::Cancel));
  assert(!control->Request(StopRequest::Remove));
  assert(control->Requested() == StopRequest::Pause);

  ItemControl quiet;
  assert(quiet.Seal() == StopRequest::None);
  assert(!quiet.Request(StopRequest::Shutdown));
  assert(!quiet.StopRequested());
}

void TestStopAllAppliesToLateRegistrations() {
  ControlRegistry registry;
  auto            early = registry.Register("early");

  registry.StopAll(StopRequest::Shutdown);
  assert(early->Requested() == StopRequest::Shutdown);

  auto late = registry.Register("late");
  assert(late->Requested() == StopRequest::Shutdown);
}

void TestSignalDoesNotLoseWakeups() {
  DispatchSignal signal;

  const auto seen = signal.Generation();
  signal.Notify();

  // notified between the read and the wait: returns at once
  const auto start = std::chrono::steady_clock::now();
  assert(signal.Wait(seen, std::chrono::seconds(30)));
  assert(std::chrono::steady_clock::now() - start < std::chrono::seconds(10));

  // times out without a notify
  assert(signal.Wait(signal.Generation(), std::chrono::milliseconds(5)));
}

void TestSignalShutdownReleasesWaiters() {
  DispatchSignal    signal;
  std::atomic<bool> returned{false};
  bool              result = true;

  std::thread waiter([&] {
    result   = signal.Wait(signal.Generation(), std::chrono::seconds(30));
    returned = true;
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  signal.Shutdown();
  waiter.join();

  assert(returned.load());
  assert(!result);
  assert(signal.IsShutdown());
  assert(!signal.Wait(signal.Generation(), std::chrono::milliseconds(1)));
}

} // namespace

int main() {
  TestRequestsNeverDowngrade();
  TestWaitForWakesOnRequest();
  TestRegistryTracksHeldItems();
  TestSealedControlRefusesRequests();
  TestStopAllAppliesToLateRegistrations();
  TestSignalDoesNotLoseWakeups();
  TestSignalShutdownReleasesWaiters();

  std::cout << "trackq_unit_scheduler_control: pass\n";
  return 0;
}
