#include "progress.hpp"

#include <algorithm>

namespace trackq::queue {

uint32_t TransferPercent(uint64_t bytes_done, uint64_t bytes_total) {
  if (bytes_total == 0) {
    return 0;
  }
  if (bytes_done >= bytes_total) {
    return 100;
  }
  return static_cast<uint32_t>((bytes_done * 100) / bytes_total);
}

uint32_t CompositePercent(uint32_t completed, uint32_t total, uint32_t provisional) {
  if (total == 0) {
    return std::min<uint32_t>(provisional, 100);
  }
  completed = std::min(completed, total);
  return static_cast<uint32_t>((200ULL * completed + total) / (2ULL * total));
}

LeafProgress::LeafProgress(uint32_t initial, uint32_t step)
    : current_(std::min<uint32_t>(initial, 100)), persisted_(current_), step_(std::max<uint32_t>(step, 1)) {
}

bool LeafProgress::Advance(uint32_t percent) {
  percent = std::min<uint32_t>(percent, 100);
  if (percent <= current_) {
    return false;
  }
  current_ = percent;

  if (current_ == 100 || current_ - persisted_ >= step_) {
    persisted_ = current_;
    return true;
  }
  return false;
}

TransferRate::TransferRate(util::TimePoint started) : last_at_(started) {
}

void TransferRate::Sample(uint64_t bytes_done, uint64_t bytes_total, util::TimePoint now) {
  const auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_at_).count();
  if (elapsed_ms > 0) {
    const uint64_t delta = bytes_done > last_bytes_ ? bytes_done - last_bytes_ : 0;
    speed_               = delta * 1000 / static_cast<uint64_t>(elapsed_ms);
    last_at_             = now;
  }
  last_bytes_ = bytes_done;

  if (speed_ > 0 && bytes_total > bytes_done) {
    eta_ = (bytes_total - bytes_done + speed_ - 1) / speed_;
  } else {
    eta_ = 0;
  }
}

void ApplyCompositeProgress(db::model::QueueItemRecord& item) {
  item.completed_tracks = std::min(item.completed_tracks, item.total_tracks);
  item.progress         = CompositePercent(item.completed_tracks, item.total_tracks, item.progress);
}

} // namespace trackq::queue
