#include "internal/queue/progress.hpp"

#include <cassert>
#include <chrono>
#include <iostream>

namespace {

using trackq::db::model::IsPartialSuccess;
using trackq::db::model::QueueItemRecord;
using trackq::queue::ApplyCompositeProgress;
using trackq::queue::CompositePercent;
using trackq::queue::LeafProgress;
using trackq::queue::TransferPercent;
using trackq::queue::TransferRate;

void TestTransferPercentIsClamped() {
  assert(TransferPercent(0, 0) == 0);
  assert(TransferPercent(10, 0) == 0);
  assert(TransferPercent(0, 1000) == 0);
  assert(TransferPercent(499, 1000) == 49);
  assert(TransferPercent(1000, 1000) == 100);
  assert(TransferPercent(5000, 1000) == 100);

  // no overflow for multi-gigabyte transfers
  assert(TransferPercent(3ull << 40, 4ull << 40) == 75);
}

void TestCompositePercentRounds() {
  assert(CompositePercent(0, 10, 0) == 0);
  assert(CompositePercent(7, 10, 0) == 70);
  assert(CompositePercent(1, 3, 0) == 33);
  assert(CompositePercent(2, 3, 0) == 67);
  assert(CompositePercent(1, 8, 0) == 13);
  assert(CompositePercent(10, 10, 0) == 100);
  assert(CompositePercent(12, 10, 0) == 100);

  // total unknown: keep the provisional value
  assert(CompositePercent(0, 0, 0) == 0);
  assert(CompositePercent(0, 0, 40) == 40);
  assert(CompositePercent(0, 0, 140) == 100);
}

void TestLeafProgressPersistsOnStep() {
  LeafProgress progress(0, 5);

  assert(!progress.Advance(3));
  assert(progress.Current() == 3);
  assert(progress.Advance(5));
  assert(!progress.Advance(9));
  assert(progress.Advance(10));

  // never moves backwards
  assert(!progress.Advance(4));
  assert(progress.Current() == 10);

  // 100 is always persisted
  LeafProgress almost(98, 5);
  assert(almost.Advance(100));
  assert(almost.Current() == 100);
  assert(!almost.Advance(100));
}

void TestLeafProgressResumesFromPersistedValue() {
  LeafProgress progress(60, 10);
  assert(progress.Current() == 60);
  assert(!progress.Advance(20));
  assert(!progress.Advance(65));
  assert(progress.Advance(70));

  LeafProgress zero_step(0, 0);
  assert(zero_step.Advance(1));
}

void TestApplyCompositeProgress() {
  QueueItemRecord item;
  item.type     = trackq::v1::ITEM_TYPE_ALBUM;
  item.progress = 0;

  ApplyCompositeProgress(item);
  assert(item.progress == 0);

  item.total_tracks     = 10;
  item.completed_tracks = 7;
  ApplyCompositeProgress(item);
  assert(item.progress == 70);

  item.completed_tracks = 15;
  ApplyCompositeProgress(item);
  assert(item.completed_tracks == 10);
  assert(item.progress == 100);
}

void TestPartialSuccessTruthTable() {
  QueueItemRecord item;
  item.type   = trackq::v1::ITEM_TYPE_ALBUM;
  item.status = trackq::v1::ITEM_STATUS_COMPLETED;

  // total 0
  assert(!IsPartialSuccess(item));

  // completed == total
  item.total_tracks     = 10;
  item.completed_tracks = 10;
  assert(!IsPartialSuccess(item));

  // completed < total
  item.completed_tracks = 7;
  assert(IsPartialSuccess(item));

  // only completed items can be partial successes
  item.status = trackq::v1::ITEM_STATUS_DOWNLOADING;
  assert(!IsPartialSuccess(item));
}

void TestTransferRateSpeedAndEta() {
  const auto   start = trackq::util::FromUnixMillis(1'000'000);
  TransferRate rate(start);
  assert(rate.BytesPerSecond() == 0 && rate.EtaSeconds() == 0);

  // 1 MiB in 2s of a 5 MiB track
  rate.Sample(1 << 20, 5 << 20, start + std::chrono::seconds(2));
  assert(rate.BytesPerSecond() == 524288);
  assert(rate.EtaSeconds() == 8);

  // speed follows the latest interval
  rate.Sample(3 << 20, 5 << 20, start + std::chrono::seconds(3));
  assert(rate.BytesPerSecond() == 2097152);
  assert(rate.EtaSeconds() == 1);

  // same instant: speed kept, eta rounded up
  rate.Sample((5 << 20) - 10, 5 << 20, start + std::chrono::seconds(3));
  assert(rate.BytesPerSecond() == 2097152);
  assert(rate.EtaSeconds() == 1);

  rate.Sample(5 << 20, 5 << 20, start + std::chrono::seconds(4));
  assert(rate.EtaSeconds() == 0);

  // unknown total
  TransferRate open_ended(start);
  open_ended.Sample(4096, 0, start + std::chrono::milliseconds(500));
  assert(open_ended.BytesPerSecond() == 8192);
  assert(open_ended.EtaSeconds() == 0);
}

} // namespace

int main() {
  TestTransferPercentIsClamped();
  TestCompositePercentRounds();
  TestLeafProgressPersistsOnStep();
  TestLeafProgressResumesFromPersistedValue();
  TestApplyCompositeProgress();
  TestPartialSuccessTruthTable();
  TestTransferRateSpeedAndEta();

  std::cout << "trackq_unit_progress: pass\n";
  return 0;
}
