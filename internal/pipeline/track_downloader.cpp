#include "track_downloader.hpp"

#include <fstream>
#include <stdexcept>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace trackq::pipeline {

namespace {

void RemoveQuietly(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec) {
    TRACKQ_LOG_WARN("partial file not removed",
                    {observability::StringField("path", path.string()), observability::StringField("error", ec.message())});
  }
}

} // namespace

TrackDownloader::TrackDownloader(std::shared_ptr<StreamFetcher> fetcher, std::shared_ptr<Decryptor> decryptor,
                                 std::shared_ptr<Tagger> tagger, DownloadOptions options)
    : fetcher_(std::move(fetcher)), decryptor_(std::move(decryptor)), tagger_(std::move(tagger)), options_(std::move(options)) {
  if (!fetcher_ || !decryptor_ || !tagger_) {
    throw std::invalid_argument("track downloader requires fetcher, decryptor and tagger");
  }
  if (options_.chunk_size_bytes == 0) {
    throw std::invalid_argument("chunk size must be positive");
  }
}

DownloadOutcome TrackDownloader::Download(const ResolvedItem& track, const std::filesystem::path& destination,
                                          const TransferProgress& progress) {
  if (destination.empty() || !destination.has_filename()) {
    throw util::DiskError("invalid destination path: '" + destination.string() + "'");
  }

  std::error_code ec;
  std::filesystem::create_directories(destination.parent_path(), ec);
  if (ec) {
    throw util::DiskError("cannot create " + destination.parent_path().string() + ": " + ec.message());
  }

  DownloadOutcome outcome;
  outcome.path = destination;

  const auto existing = std::filesystem::is_regular_file(destination, ec) ? std::filesystem::file_size(destination, ec) : 0;
  if (!ec && existing > 0) {
    TRACKQ_LOG_INFO("track already on disk, skipping download", {observability::StringField("path", destination.string()),
                                                                 observability::IntField("bytes", static_cast<int64_t>(existing))});
    Tag(track, destination);
    outcome.completed = true;
    outcome.reused    = true;
    outcome.bytes     = existing;
    return outcome;
  }

  auto partial = destination;
  partial += ".part";

  try {
    std::ofstream out(partial, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw util::DiskError("cannot open " + partial.string() + " for writing");
    }

    uint64_t chunk_index = 0;
    uint64_t bytes_done  = 0;

    const bool finished = fetcher_->Fetch(track.stream_locator, options_.chunk_size_bytes,
                                          [&](const std::string& chunk, uint64_t total_bytes) {
                                            const auto plain = decryptor_->Decrypt(chunk, chunk_index++, track.decryption_key);
                                            out.write(plain.data(), static_cast<std::streamsize>(plain.size()));
                                            if (!out) {
                                              throw util::DiskError("write failed on " + partial.string());
                                            }
                                            bytes_done += chunk.size();
                                            outcome.bytes += plain.size();
                                            return !progress || progress(bytes_done, total_bytes);
                                          });

    out.close();
    if (!finished) {
      RemoveQuietly(partial);
      outcome.completed = false;
      return outcome;
    }
    if (!out) {
      throw util::DiskError("close failed on " + partial.string());
    }

    std::filesystem::rename(partial, destination, ec);
    if (ec) {
      throw util::DiskError("cannot move " + partial.string() + " into place: " + ec.message());
    }
  } catch (...) {
    RemoveQuietly(partial);
    throw;
  }

  Tag(track, destination);

  outcome.completed = true;
  return outcome;
}

void TrackDownloader::Tag(const ResolvedItem& track, const std::filesystem::path& file) {
  try {
    tagger_->Embed(file, TrackMetadata{track.title, track.artist, track.album, track.track_number, options_.quality});
  } catch (const std::exception& e) {
    TRACKQ_LOG_WARN("tagging failed", {observability::StringField("path", file.string()), observability::StringField("error", e.what())});
  }
}

} // namespace trackq::pipeline
