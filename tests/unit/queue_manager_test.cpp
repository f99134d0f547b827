#include "internal/core/queue_manager.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/fake_collaborators.hpp"

namespace {

using trackq::core::EnqueueHints;
using trackq::core::QueueManager;
using trackq::db::model::ChildTrackRecord;
using trackq::db::model::QueueItemRecord;
using trackq::queue::QueueStore;

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

// Manager over a scheduler that is never started: nothing downloads, and a
// claimed row stands in for one left downloading without a worker.
struct Fixture {
  Fixture() {
    bridge = std::make_shared<trackq::notify::NotificationBridge>();
    store  = std::make_shared<QueueStore>(std::make_shared<trackq::db::memory::MemoryRepository>(), trackq::util::Now,
                                         [this](const QueueItemRecord& item) { bridge->Publish(item); });

    auto downloader = std::make_shared<trackq::pipeline::TrackDownloader>(std::make_shared<trackq::testing::FakeFetcher>(),
                                                                          std::make_shared<trackq::testing::FakeDecryptor>(),
                                                                          std::make_shared<trackq::testing::FakeTagger>());
    auto executor   = std::make_shared<trackq::scheduler::ItemExecutor>(store, std::make_shared<trackq::testing::FakeCatalog>(),
                                                                      downloader, trackq::queue::RetryPolicy{},
                                                                      trackq::scheduler::ExecutorOptions{"/tmp/trackq-unused"});
    scheduler       = std::make_shared<trackq::scheduler::DownloadScheduler>(store, executor, trackq::scheduler::SchedulerOptions{2});
    manager         = std::make_shared<QueueManager>(store, scheduler, bridge);
  }

  QueueItemRecord ClaimOrphan(const std::string& id) {
    manager->Enqueue(id, trackq::v1::ITEM_TYPE_TRACK);
    auto claimed = store->ClaimNextPending();
    assert(claimed.has_value() && claimed->id == id);
    return *claimed;
  }

  std::shared_ptr<trackq::notify::NotificationBridge>   bridge;
  std::shared_ptr<QueueStore>                           store;
  std::shared_ptr<trackq::scheduler::DownloadScheduler> scheduler;
  std::shared_ptr<QueueManager>                         manager;
};

void TestEnqueueValidatesInput() {
  Fixture f;

  assert(Throws<trackq::util::InvalidArgument>([&] { f.manager->Enqueue("", trackq::v1::ITEM_TYPE_TRACK); }));
  assert(Throws<trackq::util::InvalidArgument>([&] { f.manager->Enqueue("t1", trackq::v1::ITEM_TYPE_UNSPECIFIED); }));
  assert(Throws<trackq::util::InvalidArgument>([&] { f.manager->Enqueue("t1", static_cast<trackq::v1::ItemType>(99)); }));

  const auto item = f.manager->Enqueue("t1", trackq::v1::ITEM_TYPE_TRACK, EnqueueHints{"Song", "Artist", "Album"});
  assert(item.status == trackq::v1::ITEM_STATUS_PENDING);
  assert(item.title == "Song" && item.artist == "Artist" && item.album == "Album");
  assert(item.progress == 0 && item.retry_count == 0);

  assert(Throws<trackq::util::DuplicateId>([&] { f.manager->Enqueue("t1", trackq::v1::ITEM_TYPE_ALBUM); }));
  assert(f.manager->Stats().total == 1);
}

void TestPauseAndResume() {
  Fixture f;
  f.ClaimOrphan("active");
  f.manager->Enqueue("pending", trackq::v1::ITEM_TYPE_TRACK);

  assert(Throws<trackq::util::InvalidTransition>([&] { f.manager->Pause("pending"); }));
  assert(Throws<trackq::util::InvalidTransition>([&] { f.manager->Resume("pending"); }));
  assert(Throws<trackq::util::NotFound>([&] { f.manager->Pause("missing"); }));

  f.store->Modify("active", [](QueueItemRecord& record) { record.progress = 40; });

  const auto paused = f.manager->Pause("active");
  assert(paused.status == trackq::v1::ITEM_STATUS_PAUSED);
  assert(paused.progress == 40);

  // pausing again is a no-op
  const auto again = f.manager->Pause("active");
  assert(again.status == trackq::v1::ITEM_STATUS_PAUSED);
  assert(again.updated_at_ms == paused.updated_at_ms);

  const auto resumed = f.manager->Resume("active");
  assert(resumed.status == trackq::v1::ITEM_STATUS_PENDING);
  assert(resumed.progress == 40);
  assert(resumed.updated_at_ms > paused.updated_at_ms);

  // resumed items go to the back of the queue
  auto next = f.store->ClaimNextPending();
  assert(next.has_value() && next->id == "pending");
}

void TestCancel() {
  Fixture f;
  f.ClaimOrphan("active");
  f.manager->Enqueue("pending", trackq::v1::ITEM_TYPE_TRACK);

  const auto cancelled = f.manager->Cancel("pending");
  assert(cancelled.status == trackq::v1::ITEM_STATUS_FAILED);
  assert(cancelled.error_message == "cancelled by user");

  const auto stopped = f.manager->Cancel("active");
  assert(stopped.status == trackq::v1::ITEM_STATUS_FAILED);
  assert(stopped.error_message == "cancelled by user");

  assert(Throws<trackq::util::InvalidTransition>([&] { f.manager->Cancel("pending"); }));

  f.manager->Enqueue("paused", trackq::v1::ITEM_TYPE_TRACK);
  f.store->Modify("paused", [](QueueItemRecord& record) { record.status = trackq::v1::ITEM_STATUS_PAUSED; });
  assert(f.manager->Cancel("paused").status == trackq::v1::ITEM_STATUS_FAILED);
}

void TestRetryResetsTerminalItems() {
  Fixture f;
  f.manager->Enqueue("t1", trackq::v1::ITEM_TYPE_TRACK);

  assert(Throws<trackq::util::InvalidTransition>([&] { f.manager->Retry("t1"); }));

  f.store->Modify("t1", [](QueueItemRecord& record) {
    record.status           = trackq::v1::ITEM_STATUS_FAILED;
    record.retry_count      = 3;
    record.error_message    = "timeout";
    record.progress         = 60;
    record.bytes_downloaded = 600;
  });

  const auto retried = f.manager->Retry("t1");
  assert(retried.status == trackq::v1::ITEM_STATUS_PENDING);
  assert(retried.retry_count == 0);
  assert(retried.error_message.empty());
  assert(retried.progress == 0);
  assert(retried.bytes_downloaded == 0);
  assert(retried.next_attempt_at_ms == 0);
}

void TestRetryCompositeResetsFailedChildren() {
  Fixture f;
  f.manager->Enqueue("a1", trackq::v1::ITEM_TYPE_ALBUM);

  for (uint32_t i = 1; i <= 4; ++i) {
    ChildTrackRecord child;
    child.parent_id = "a1";
    child.track_id  = "t" + std::to_string(i);
    child.position  = i;
    child.status    = i <= 3 ? trackq::v1::CHILD_STATUS_COMPLETED : trackq::v1::CHILD_STATUS_FAILED;
    child.attempts  = 4;
    if (i == 4) child.error_message = "not streamable";
    f.store->UpsertChild(child);
  }
  f.store->Modify("a1", [](QueueItemRecord& record) {
    record.status           = trackq::v1::ITEM_STATUS_COMPLETED;
    record.total_tracks     = 4;
    record.completed_tracks = 3;
    record.progress         = 75;
  });
  assert(f.manager->FailedTracks("a1").size() == 1);

  const auto retried = f.manager->Retry("a1");
  assert(retried.status == trackq::v1::ITEM_STATUS_PENDING);
  assert(retried.completed_tracks == 3);
  assert(retried.progress == 75);
  assert(f.manager->FailedTracks("a1").empty());

  const auto counts = f.store->CountChildren("a1");
  assert(counts.completed == 3 && counts.failed == 0 && counts.total == 4);
}

void TestRemoveAndClear() {
  Fixture f;
  f.ClaimOrphan("t4");
  f.manager->Enqueue("t1", trackq::v1::ITEM_TYPE_TRACK);
  f.manager->Enqueue("t2", trackq::v1::ITEM_TYPE_TRACK);
  f.manager->Enqueue("t3", trackq::v1::ITEM_TYPE_TRACK);

  f.manager->Remove("t1");
  assert(Throws<trackq::util::NotFound>([&] { f.manager->Get("t1"); }));
  assert(Throws<trackq::util::NotFound>([&] { f.manager->Remove("t1"); }));

  f.store->Modify("t2", [](QueueItemRecord& record) { record.status = trackq::v1::ITEM_STATUS_COMPLETED; });
  assert(f.manager->ClearCompleted() == 1);
  assert(f.manager->Stats().total == 2);

  assert(f.manager->ClearAll() == 2);
  assert(f.manager->Stats().total == 0);
}

void TestListingAndReads() {
  Fixture f;
  for (int i = 0; i < 5; ++i) {
    f.manager->Enqueue("t" + std::to_string(i), trackq::v1::ITEM_TYPE_TRACK);
  }
  f.store->Modify("t1", [](QueueItemRecord& record) { record.status = trackq::v1::ITEM_STATUS_FAILED; });
  f.store->Modify("t3", [](QueueItemRecord& record) { record.status = trackq::v1::ITEM_STATUS_FAILED; });

  assert(f.manager->List(0, 0).size() == 5);
  assert(f.manager->List(1, 2).size() == 2);
  assert(f.manager->List(1, 2)[0].id == "t1");

  const auto failed = f.manager->List(0, 0, trackq::v1::ITEM_STATUS_FAILED);
  assert(failed.size() == 2);
  assert(failed[0].id == "t1" && failed[1].id == "t3");

  const auto stats = f.manager->Stats();
  assert(stats.total == 5 && stats.pending == 3 && stats.failed == 2);

  assert(Throws<trackq::util::NotFound>([&] { f.manager->FailedTracks("missing"); }));
  assert(f.manager->FailedTracks("t0").empty());
}

void TestSubscribersSeeTransitions() {
  Fixture f;

  std::mutex                          mutex;
  std::vector<trackq::v1::ItemStatus> seen;
  const auto                          id = f.manager->Subscribe([&](const QueueItemRecord& item) {
    std::lock_guard lock(mutex);
    seen.push_back(item.status);
  });

  f.manager->Enqueue("t1", trackq::v1::ITEM_TYPE_TRACK);
  f.manager->Cancel("t1");
  f.manager->Retry("t1");
  f.bridge->Flush();

  {
    std::lock_guard lock(mutex);
    assert(seen.size() == 3);
    assert(seen[0] == trackq::v1::ITEM_STATUS_PENDING);
    assert(seen[1] == trackq::v1::ITEM_STATUS_FAILED);
    assert(seen[2] == trackq::v1::ITEM_STATUS_PENDING);
  }

  f.manager->Unsubscribe(id);
  f.manager->Enqueue("t2", trackq::v1::ITEM_TYPE_TRACK);
  f.bridge->Flush();

  std::lock_guard lock(mutex);
  assert(seen.size() == 3);
}

} // namespace

int main() {
  TestEnqueueValidatesInput();
  TestPauseAndResume();
  TestCancel();
  TestRetryResetsTerminalItems();
  TestRetryCompositeResetsFailedChildren();
  TestRemoveAndClear();
  TestListingAndReads();
  TestSubscribersSeeTransitions();

  std::cout << "trackq_unit_queue_manager: pass\n";
  return 0;
}
