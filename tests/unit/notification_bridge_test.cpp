#include "internal/notify/notification_bridge.hpp"

#include <atomic>
#include <chrono>
#include <cassert>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

using trackq::db::model::QueueItemRecord;
using trackq::notify::NotificationBridge;

QueueItemRecord Snapshot(const std::string& id, uint32_t progress) {
  QueueItemRecord item;
  item.id       = id;
  item.progress = progress;
  return item;
}

void TestDeliversInPublishOrder() {
  NotificationBridge bridge;

  std::mutex            mutex;
  std::vector<uint32_t> seen;
  bridge.Subscribe([&](const QueueItemRecord& item) {
    std::lock_guard lock(mutex);
    seen.push_back(item.progress);
  });

  for (uint32_t i = 0; i <= 100; i += 10) {
    bridge.Publish(Snapshot("t1", i));
  }
  bridge.Flush();

  std::lock_guard lock(mutex);
  assert(seen.size() == 11);
  for (std::size_t i = 1; i < seen.size(); ++i) {
    assert(seen[i] > seen[i - 1]);
  }
}

void TestListenersRunOffThePublishingThread() {
  NotificationBridge bridge;

  const auto        publisher = std::this_thread::get_id();
  std::atomic<bool> other_thread{false};
  bridge.Subscribe([&](const QueueItemRecord&) { other_thread = std::this_thread::get_id() != publisher; });

  bridge.Publish(Snapshot("t1", 0));
  bridge.Flush();
  assert(other_thread.load());
}

void TestThrowingListenerIsIsolated() {
  NotificationBridge bridge;

  std::atomic<int> delivered{0};
  bridge.Subscribe([](const QueueItemRecord&) { throw std::runtime_error("presentation layer exploded"); });
  bridge.Subscribe([](const QueueItemRecord&) { throw 42; });
  bridge.Subscribe([&](const QueueItemRecord&) { ++delivered; });

  bridge.Publish(Snapshot("t1", 10));
  bridge.Publish(Snapshot("t1", 20));
  bridge.Flush();

  assert(delivered.load() == 2);
  assert(bridge.SubscriberCount() == 3);
}

void TestUnsubscribeStopsDelivery() {
  NotificationBridge bridge;

  std::atomic<int> count{0};
  const auto       id = bridge.Subscribe([&](const QueueItemRecord&) { ++count; });

  bridge.Publish(Snapshot("t1", 10));
  bridge.Flush();
  assert(count.load() == 1);

  bridge.Unsubscribe(id);
  assert(bridge.SubscriberCount() == 0);

  bridge.Publish(Snapshot("t1", 20));
  bridge.Flush();
  assert(count.load() == 1);
}

void TestShutdownDrainsQueue() {
  std::atomic<int> count{0};
  {
    NotificationBridge bridge;
    bridge.Subscribe([&](const QueueItemRecord&) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
      ++count;
    });

    for (int i = 0; i < 50; ++i) {
      bridge.Publish(Snapshot("t" + std::to_string(i), 100));
    }
    bridge.Shutdown();
    assert(count.load() == 50);

    // dropped, not delivered
    bridge.Publish(Snapshot("late", 100));
    bridge.Shutdown();
  }
  assert(count.load() == 50);
}

void TestConcurrentPublishers() {
  NotificationBridge bridge;

  std::atomic<int> count{0};
  bridge.Subscribe([&](const QueueItemRecord&) { ++count; });

  std::vector<std::thread> publishers;
  for (int t = 0; t < 4; ++t) {
    publishers.emplace_back([&bridge, t]() {
      for (int i = 0; i < 250; ++i) {
        bridge.Publish(Snapshot("t" + std::to_string(t), static_cast<uint32_t>(i % 101)));
      }
    });
  }
  for (auto& publisher : publishers) publisher.join();

  bridge.Flush();
  assert(count.load() == 1000);
}

} // namespace

int main() {
  TestDeliversInPublishOrder();
  TestListenersRunOffThePublishingThread();
  TestThrowingListenerIsIsolated();
  TestUnsubscribeStopsDelivery();
  TestShutdownDrainsQueue();
  TestConcurrentPublishers();

  std::cout << "trackq_unit_notification_bridge: pass\n";
  return 0;
}
