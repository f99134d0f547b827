#pragma once

#include <cstdint>

#include "internal/db/model/queue_item_record.hpp"
#include "internal/util/time.hpp"

namespace trackq::queue {

/*
  Progress rules shared by the executor and the store callers.

  Leaf items report raw transfer percentage; composite items derive progress
  from finished children. Progress never exceeds 100 and never moves
  backwards within a run.
*/

// Transfer percentage clamped to [0,100]; 0 when the total is unknown.
uint32_t TransferPercent(uint64_t bytes_done, uint64_t bytes_total);

// round(100 * completed / total); `provisional` while total is unknown.
uint32_t CompositePercent(uint32_t completed, uint32_t total, uint32_t provisional);

/*
  Tracks leaf progress for one run and decides when a value is worth
  persisting: after advancing at least `step` points, or on reaching 100.
*/
class LeafProgress {
 public:
  LeafProgress(uint32_t initial, uint32_t step);

  // Returns true if the new value should be persisted.
  bool Advance(uint32_t percent);

  uint32_t Current() const {
    return current_;
  }

 private:
  uint32_t current_;
  uint32_t persisted_;
  uint32_t step_;
};

/*
  Transfer rate of one leaf run, sampled at each persisted progress update.
  Speed is the byte delta over the time since the previous sample (the
  start of the run for the first one); a sample taken in the same
  millisecond keeps the previous speed.
*/
class TransferRate {
 public:
  explicit TransferRate(util::TimePoint started);

  void Sample(uint64_t bytes_done, uint64_t bytes_total, util::TimePoint now);

  uint64_t BytesPerSecond() const {
    return speed_;
  }

  // Rounded up; 0 while the speed or the total is unknown.
  uint64_t EtaSeconds() const {
    return eta_;
  }

 private:
  util::TimePoint last_at_;
  uint64_t        last_bytes_ = 0;
  uint64_t        speed_      = 0;
  uint64_t        eta_        = 0;
};

// Recomputes progress from total/completed tracks of a composite item.
void ApplyCompositeProgress(db::model::QueueItemRecord& item);

} // namespace trackq::queue
