#pragma once

#include <cstdint>
#include <string>

namespace trackq::db::model {

// Append-only completion record. Outlives the queue item it came from.
struct HistoryRecord {
  uint64_t    id = 0;
  std::string track_id;
  std::string title;
  std::string artist;
  std::string album;
  std::string file_path;
  uint64_t    file_size_bytes  = 0;
  std::string quality;
  uint64_t    downloaded_at_ms = 0;
};

} // namespace trackq::db::model
