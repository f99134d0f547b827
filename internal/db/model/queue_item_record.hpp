#pragma once

#include <cstdint>
#include <string>

#include "trackq/v1/queue.pb.h"

namespace trackq::db::model {

/*
  Persistent queue item row.

  - id is the caller-assigned catalog id.
  - updated_at_ms strictly increases on every store mutation and doubles as
    the claim order key for pending items.
  - completed_at_ms is written once (0 = unset).
  - next_attempt_at_ms holds back-off for requeued items (0 = eligible now).
*/

struct QueueItemRecord {
  std::string id;

  trackq::v1::ItemType   type   = trackq::v1::ITEM_TYPE_TRACK;
  trackq::v1::ItemStatus status = trackq::v1::ITEM_STATUS_PENDING;

  std::string title;
  std::string artist;
  std::string album;

  uint32_t    progress = 0;
  std::string output_path;
  std::string download_url;
  std::string error_message;
  uint32_t    retry_count = 0;

  // composite items only
  uint32_t total_tracks     = 0;
  uint32_t completed_tracks = 0;

  uint64_t bytes_downloaded = 0;
  uint64_t total_bytes      = 0;

  // transfer rate of the running download; 0 when not downloading or unknown
  uint64_t speed_bytes_per_sec = 0;
  uint64_t eta_seconds         = 0;

  uint64_t created_at_ms      = 0;
  uint64_t updated_at_ms      = 0;
  uint64_t completed_at_ms    = 0;
  uint64_t next_attempt_at_ms = 0;
};

inline bool IsComposite(trackq::v1::ItemType type) {
  return type == trackq::v1::ITEM_TYPE_ALBUM || type == trackq::v1::ITEM_TYPE_PLAYLIST || type == trackq::v1::ITEM_TYPE_ARTIST;
}

inline bool IsPartialSuccess(const QueueItemRecord& item) {
  return item.status == trackq::v1::ITEM_STATUS_COMPLETED && item.total_tracks > 0 && item.completed_tracks < item.total_tracks;
}

// Tombstone published by the store when the row is deleted.
inline bool IsRemoved(const QueueItemRecord& item) {
  return item.status == trackq::v1::ITEM_STATUS_UNSPECIFIED;
}

} // namespace trackq::db::model
