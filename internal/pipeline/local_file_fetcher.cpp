#include "local_file_fetcher.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>

#include "internal/util/errors.hpp"

namespace trackq::pipeline {

bool LocalFileFetcher::Fetch(const std::string& locator, uint64_t chunk_size, const ChunkSink& sink) {
  std::error_code ec;
  const auto      total = std::filesystem::file_size(locator, ec);
  if (ec) {
    throw util::ContentUnavailable("stream source missing: " + locator);
  }

  std::ifstream in(locator, std::ios::binary);
  if (!in) {
    throw util::TransientError("cannot open stream source: " + locator);
  }

  std::string chunk(chunk_size, '\0');
  while (in) {
    in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
    const auto got = in.gcount();
    if (got <= 0) break;

    if (!sink(chunk.substr(0, static_cast<std::size_t>(got)), total)) {
      return false;
    }
  }

  if (in.bad()) {
    throw util::TransientError("read failed on stream source: " + locator);
  }
  return true;
}

} // namespace trackq::pipeline
