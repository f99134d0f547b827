#pragma once

#include <cstdint>

namespace trackq::db::model {

struct QueueStats {
  uint64_t total       = 0;
  uint64_t pending     = 0;
  uint64_t downloading = 0;
  uint64_t paused      = 0;
  uint64_t completed   = 0;
  uint64_t failed      = 0;
};

} // namespace trackq::db::model
