#pragma once

#include <cstdint>
#include <string>

#include "trackq/v1/queue.pb.h"

namespace trackq::db::model {

// One child track of a composite item. Keyed by (parent_id, track_id).
struct ChildTrackRecord {
  std::string parent_id;
  std::string track_id;
  uint32_t    position = 0;

  std::string title;
  std::string artist;

  trackq::v1::ChildStatus status = trackq::v1::CHILD_STATUS_PENDING;

  std::string error_message;
  uint32_t    attempts = 0;

  std::string file_path;
  uint64_t    file_size_bytes = 0;
  uint64_t    updated_at_ms   = 0;
};

} // namespace trackq::db::model
