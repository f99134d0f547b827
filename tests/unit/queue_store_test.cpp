#include "internal/queue/queue_store.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using trackq::db::model::ChildTrackRecord;
using trackq::db::model::HistoryRecord;
using trackq::db::model::QueueItemRecord;
using trackq::queue::QueueStore;

// Clock frozen at a fixed instant; stamps must still increase.
trackq::util::TimePoint FrozenClock() {
  return trackq::util::FromUnixMillis(1'700'000'000'000);
}

std::shared_ptr<QueueStore> MakeStore(QueueStore::ItemObserver observer = nullptr) {
  return std::make_shared<QueueStore>(std::make_shared<trackq::db::memory::MemoryRepository>(), FrozenClock, std::move(observer));
}

QueueItemRecord Track(const std::string& id) {
  QueueItemRecord item;
  item.id    = id;
  item.type  = trackq::v1::ITEM_TYPE_TRACK;
  item.title = "Title " + id;
  return item;
}

QueueItemRecord Album(const std::string& id) {
  auto item = Track(id);
  item.type = trackq::v1::ITEM_TYPE_ALBUM;
  return item;
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestAddAndGetRoundTrip() {
  auto store = MakeStore();

  auto item        = Track("t1");
  item.artist      = "Artist";
  item.album       = "Album";
  item.status      = trackq::v1::ITEM_STATUS_UNSPECIFIED;
  const auto added = store->Add(item);

  assert(added.status == trackq::v1::ITEM_STATUS_PENDING);
  assert(added.created_at_ms != 0);
  assert(added.updated_at_ms == added.created_at_ms);
  assert(added.completed_at_ms == 0);

  const auto loaded = store->GetById("t1");
  assert(loaded.id == "t1");
  assert(loaded.title == "Title t1");
  assert(loaded.artist == "Artist");
  assert(loaded.album == "Album");
  assert(loaded.created_at_ms == added.created_at_ms);

  assert(Throws<trackq::util::DuplicateId>([&] { store->Add(Track("t1")); }));
  assert(Throws<trackq::util::NotFound>([&] { store->GetById("missing"); }));
}

void TestUpdateBumpsUpdatedAtStrictly() {
  auto store = MakeStore();
  auto item  = store->Add(Track("t1"));

  uint64_t last = item.updated_at_ms;
  for (int i = 0; i < 5; ++i) {
    item.progress = static_cast<uint32_t>(10 * (i + 1));
    item          = store->Update(item);
    assert(item.updated_at_ms > last);
    last = item.updated_at_ms;
  }

  // created_at is never overwritten by callers
  auto tampered          = item;
  tampered.created_at_ms = 1;
  assert(store->Update(tampered).created_at_ms == item.created_at_ms);

  assert(Throws<trackq::util::NotFound>([&] { store->Update(Track("missing")); }));
}

void TestInvariantsAreEnforced() {
  auto store = MakeStore();
  store->Add(Album("a1"));

  assert(Throws<trackq::util::InvalidArgument>([&] { store->Modify("a1", [](QueueItemRecord& r) { r.progress = 101; }); }));
  assert(Throws<trackq::util::InvalidArgument>([&] {
    store->Modify("a1", [](QueueItemRecord& r) {
      r.total_tracks     = 2;
      r.completed_tracks = 3;
    });
  }));
  assert(Throws<trackq::util::InvalidArgument>([&] { store->Add(Track("")); }));

  // rejected mutations leave the row untouched
  assert(store->GetById("a1").progress == 0);
}

void TestCompletedAtIsWrittenOnce() {
  auto store = MakeStore();
  store->Add(Track("t1"));

  auto done = store->Modify("t1", [](QueueItemRecord& r) { r.status = trackq::v1::ITEM_STATUS_FAILED; });
  assert(done.completed_at_ms == done.updated_at_ms);

  auto again = store->Modify("t1", [](QueueItemRecord& r) { r.status = trackq::v1::ITEM_STATUS_PENDING; });
  assert(again.completed_at_ms == done.completed_at_ms);

  auto completed = store->Modify("t1", [](QueueItemRecord& r) { r.status = trackq::v1::ITEM_STATUS_COMPLETED; });
  assert(completed.completed_at_ms == done.completed_at_ms);
}

void TestModifyIsAtomicUnderContention() {
  auto store = MakeStore();
  store->Add(Track("t1"));

  constexpr int            kThreads = 8;
  constexpr int            kRounds  = 100;
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&store]() {
      for (int i = 0; i < kRounds; ++i) {
        store->Modify("t1", [](QueueItemRecord& r) { r.retry_count += 1; });
      }
    });
  }
  for (auto& thread : threads) thread.join();

  assert(store->GetById("t1").retry_count == kThreads * kRounds);
}

void TestModifyAbortsWhenMutationThrows() {
  auto store  = MakeStore();
  auto before = store->Add(Track("t1"));

  assert(Throws<std::runtime_error>([&] {
    store->Modify("t1", [](QueueItemRecord& r) {
      r.progress = 50;
      throw std::runtime_error("abort");
    });
  }));

  auto after = store->GetById("t1");
  assert(after.progress == 0);
  assert(after.updated_at_ms == before.updated_at_ms);
}

void TestClaimOrderAndBackoff() {
  auto store = MakeStore();
  store->Add(Track("a"));
  store->Add(Track("b"));
  store->Add(Track("c"));

  // "a" is touched, which moves it to the back of the queue
  store->Modify("a", [](QueueItemRecord& r) { r.title = "renamed"; });

  // "b" is backing off into the future
  store->Modify("b", [&](QueueItemRecord& r) { r.next_attempt_at_ms = store->NowMs() + 60'000; });

  std::vector<std::string> registered;
  auto                     first = store->ClaimNextPending([&](const QueueItemRecord& r) { registered.push_back(r.id); });
  assert(first.has_value());
  assert(first->id == "c");
  assert(first->status == trackq::v1::ITEM_STATUS_DOWNLOADING);
  assert(store->GetById("c").status == trackq::v1::ITEM_STATUS_DOWNLOADING);

  auto second = store->ClaimNextPending();
  assert(second.has_value());
  assert(second->id == "a");

  assert(!store->ClaimNextPending().has_value());
  assert(registered.size() == 1 && registered[0] == "c");
}

void TestClaimCallbackFailureRollsBack() {
  auto store = MakeStore();
  store->Add(Track("t1"));

  assert(Throws<std::logic_error>([&] { store->ClaimNextPending([](const QueueItemRecord&) { throw std::logic_error("busy"); }); }));
  assert(store->GetById("t1").status == trackq::v1::ITEM_STATUS_PENDING);
}

void TestConcurrentClaimsNeverShareAnItem() {
  auto store = MakeStore();
  for (int i = 0; i < 200; ++i) {
    store->Add(Track("t" + std::to_string(i)));
  }

  std::atomic<int>         claimed{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&]() {
      while (auto item = store->ClaimNextPending()) {
        ++claimed;
      }
    });
  }
  for (auto& thread : threads) thread.join();

  assert(claimed.load() == 200);
  assert(store->GetStats().downloading == 200);
}

void TestResetInterrupted() {
  auto store = MakeStore();
  store->Add(Track("t1"));
  store->Add(Track("t2"));
  store->ClaimNextPending();

  auto reset = store->ResetInterrupted();
  assert(reset.size() == 1);
  assert(reset[0].id == "t1");
  assert(store->GetById("t1").status == trackq::v1::ITEM_STATUS_PENDING);
  assert(store->GetStats().pending == 2);
}

void TestListingAndStats() {
  auto store = MakeStore();
  store->Add(Track("t1"));
  store->Add(Track("t2"));
  store->Add(Track("t3"));
  store->Modify("t2", [](QueueItemRecord& r) { r.status = trackq::v1::ITEM_STATUS_PAUSED; });

  auto all = store->GetAll();
  assert(all.size() == 3);
  assert(all[0].id == "t1" && all[1].id == "t2" && all[2].id == "t3");

  auto page = store->GetAll(1, 1);
  assert(page.size() == 1 && page[0].id == "t2");

  auto paused = store->GetByStatus(trackq::v1::ITEM_STATUS_PAUSED);
  assert(paused.size() == 1 && paused[0].id == "t2");

  auto stats = store->GetStats();
  assert(stats.total == 3);
  assert(stats.pending == 2);
  assert(stats.paused == 1);
}

void TestRemoveAndClear() {
  auto store = MakeStore();
  store->Add(Track("done"));
  store->Add(Album("partial"));
  store->Add(Track("pending"));
  store->Modify("done", [](QueueItemRecord& r) { r.status = trackq::v1::ITEM_STATUS_COMPLETED; });
  store->Modify("partial", [](QueueItemRecord& r) {
    r.status           = trackq::v1::ITEM_STATUS_COMPLETED;
    r.total_tracks     = 10;
    r.completed_tracks = 7;
  });

  assert(store->ClearCompleted() == 1);
  assert(store->GetAll().size() == 2);

  store->Remove("pending");
  assert(Throws<trackq::util::NotFound>([&] { store->Remove("pending"); }));

  store->AddToHistory(HistoryRecord{.track_id = "partial", .title = "Album"});
  assert(store->ClearAll() == 1);
  assert(store->GetAll().empty());
  assert(store->GetHistory().size() == 1);
}

void TestChildTracks() {
  auto store = MakeStore();
  store->Add(Album("a1"));

  for (uint32_t i = 1; i <= 4; ++i) {
    ChildTrackRecord child;
    child.parent_id = "a1";
    child.track_id  = "a1-t" + std::to_string(i);
    child.position  = i;
    child.status    = trackq::v1::CHILD_STATUS_PENDING;
    store->UpsertChild(child);
  }
  store->Modify("a1", [](QueueItemRecord& r) { r.total_tracks = 4; });

  auto children = store->GetChildren("a1");
  assert(children.size() == 4);

  children[0].status = trackq::v1::CHILD_STATUS_COMPLETED;
  auto parent        = store->CommitChild(children[0], nullptr);
  assert(parent.completed_tracks == 1);

  // committing the same child twice counts it once
  parent = store->CommitChild(children[0], nullptr);
  assert(parent.completed_tracks == 1);

  children[1].status        = trackq::v1::CHILD_STATUS_FAILED;
  children[1].error_message = "not streamable";
  children[1].attempts      = 2;
  bool saw_counts           = false;
  parent = store->CommitChild(children[1], [&](QueueItemRecord& record, const trackq::queue::ChildCounts& counts) {
    saw_counts = true;
    assert(counts.total == 4);
    assert(counts.completed == 1);
    assert(counts.failed == 1);
    assert(counts.Finished() == 2);
    record.progress = 25;
  });
  assert(saw_counts);
  assert(parent.progress == 25);

  auto failed = store->GetFailedChildren("a1");
  assert(failed.size() == 1);
  assert(failed[0].track_id == "a1-t2");

  assert(store->ResetFailedChildren("a1") == 1);
  auto counts = store->CountChildren("a1");
  assert(counts.failed == 0);
  assert(counts.completed == 1);
  auto reset = store->GetChildren("a1")[1];
  assert(reset.status == trackq::v1::CHILD_STATUS_PENDING);
  assert(reset.attempts == 0);
  assert(reset.error_message.empty());

  ChildTrackRecord orphan;
  orphan.parent_id = "missing";
  orphan.track_id  = "x";
  assert(Throws<trackq::util::NotFound>([&] { store->UpsertChild(orphan); }));

  store->Remove("a1");
  assert(store->GetChildren("a1").empty());
}

void TestHistoryIsNewestFirst() {
  auto store = MakeStore();
  store->AddToHistory(HistoryRecord{.track_id = "old", .downloaded_at_ms = 1000});
  store->AddToHistory(HistoryRecord{.track_id = "new", .downloaded_at_ms = 2000});
  store->AddToHistory(HistoryRecord{.track_id = "stamped"});

  auto history = store->GetHistory();
  assert(history.size() == 3);
  assert(history[0].track_id == "stamped");
  assert(history[0].downloaded_at_ms == store->NowMs());
  assert(history[1].track_id == "new");
  assert(history[2].track_id == "old");
}

void TestObserverSeesCommittedSnapshots() {
  std::vector<QueueItemRecord> seen;
  auto                         store = MakeStore([&](const QueueItemRecord& item) { seen.push_back(item); });

  store->Add(Track("t1"));
  store->ClaimNextPending();
  store->Modify("t1", [](QueueItemRecord& r) { r.progress = 40; });

  // aborted mutations are not observed
  assert(Throws<trackq::util::InvalidArgument>([&] { store->Modify("t1", [](QueueItemRecord& r) { r.progress = 400; }); }));

  assert(seen.size() == 3);
  assert(seen[0].status == trackq::v1::ITEM_STATUS_PENDING);
  assert(seen[1].status == trackq::v1::ITEM_STATUS_DOWNLOADING);
  assert(seen[2].progress == 40);
  assert(seen[0].updated_at_ms < seen[1].updated_at_ms && seen[1].updated_at_ms < seen[2].updated_at_ms);
}

void TestDeletionsPublishTombstones() {
  std::vector<QueueItemRecord> seen;
  auto                         store = MakeStore([&](const QueueItemRecord& item) { seen.push_back(item); });

  store->Add(Track("done"));
  store->Add(Album("partial"));
  store->Add(Track("t1"));
  store->Add(Track("t2"));
  store->Modify("done", [](QueueItemRecord& r) { r.status = trackq::v1::ITEM_STATUS_COMPLETED; });
  store->Modify("partial", [](QueueItemRecord& r) {
    r.status           = trackq::v1::ITEM_STATUS_COMPLETED;
    r.total_tracks     = 3;
    r.completed_tracks = 2;
  });
  seen.clear();

  std::vector<std::string> hooked;
  store->Remove("t1", [&](const QueueItemRecord& item) {
    assert(item.status == trackq::v1::ITEM_STATUS_PENDING);
    hooked.push_back(item.id);
  });
  assert(seen.size() == 1);
  assert(seen[0].id == "t1" && trackq::db::model::IsRemoved(seen[0]));

  assert(store->ClearCompleted() == 1);
  assert(seen.size() == 2);
  assert(seen[1].id == "done" && trackq::db::model::IsRemoved(seen[1]));

  assert(store->ClearAll([&](const QueueItemRecord& item) { hooked.push_back(item.id); }) == 2);
  assert(seen.size() == 4);
  assert(trackq::db::model::IsRemoved(seen[2]) && trackq::db::model::IsRemoved(seen[3]));
  assert((hooked == std::vector<std::string>{"t1", "partial", "t2"}));

  // a failed remove publishes nothing
  assert(Throws<trackq::util::NotFound>([&] { store->Remove("t1"); }));
  assert(seen.size() == 4);

  // tombstones are never written back
  store->Add(Track("t3"));
  assert(Throws<trackq::util::InvalidArgument>(
      [&] { store->Modify("t3", [](QueueItemRecord& r) { r.status = trackq::v1::ITEM_STATUS_UNSPECIFIED; }); }));
}

void TestTransferRateClearedOutsideDownloading() {
  auto store = MakeStore();
  store->Add(Track("t1"));
  store->ClaimNextPending();

  auto running = store->Modify("t1", [](QueueItemRecord& r) {
    r.speed_bytes_per_sec = 2048;
    r.eta_seconds         = 12;
  });
  assert(running.speed_bytes_per_sec == 2048 && running.eta_seconds == 12);
  assert(store->GetById("t1").eta_seconds == 12);

  auto paused = store->Modify("t1", [](QueueItemRecord& r) { r.status = trackq::v1::ITEM_STATUS_PAUSED; });
  assert(paused.speed_bytes_per_sec == 0 && paused.eta_seconds == 0);
  assert(store->GetById("t1").speed_bytes_per_sec == 0);
}

} // namespace

int main() {
  TestAddAndGetRoundTrip();
  TestUpdateBumpsUpdatedAtStrictly();
  TestInvariantsAreEnforced();
  TestCompletedAtIsWrittenOnce();
  TestModifyIsAtomicUnderContention();
  TestModifyAbortsWhenMutationThrows();
  TestClaimOrderAndBackoff();
  TestClaimCallbackFailureRollsBack();
  TestConcurrentClaimsNeverShareAnItem();
  TestResetInterrupted();
  TestListingAndStats();
  TestRemoveAndClear();
  TestChildTracks();
  TestHistoryIsNewestFirst();
  TestObserverSeesCommittedSnapshots();
  TestDeletionsPublishTombstones();
  TestTransferRateClearedOutsideDownloading();

  std::cout << "trackq_unit_queue_store: pass\n";
  return 0;
}
