#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

#include "collaborators.hpp"

namespace trackq::pipeline {

struct DownloadOptions {
  uint64_t    chunk_size_bytes = 64 * 1024;
  std::string quality          = "MP3_320";
};

// Called after every chunk; returning false abandons the transfer.
using TransferProgress = std::function<bool(uint64_t bytes_done, uint64_t bytes_total)>;

struct DownloadOutcome {
  bool                  completed = false;
  bool                  reused    = false; // destination already present, nothing fetched
  std::filesystem::path path;
  uint64_t              bytes = 0;
};

/*
  Leaf download: fetch -> decrypt each chunk -> write "<dest>.part" ->
  rename to dest -> tag.

  A non-empty file already at dest is kept as is and only re-tagged.
  The partial file is removed when the transfer is abandoned or fails.
  Tagging failures are logged and do not fail the download.
*/
class TrackDownloader {
 public:
  TrackDownloader(std::shared_ptr<StreamFetcher> fetcher, std::shared_ptr<Decryptor> decryptor, std::shared_ptr<Tagger> tagger,
                  DownloadOptions options = {});

  DownloadOutcome Download(const ResolvedItem& track, const std::filesystem::path& destination, const TransferProgress& progress);

  const DownloadOptions& Options() const {
    return options_;
  }

 private:
  void Tag(const ResolvedItem& track, const std::filesystem::path& file);

  std::shared_ptr<StreamFetcher> fetcher_;
  std::shared_ptr<Decryptor>     decryptor_;
  std::shared_ptr<Tagger>        tagger_;
  DownloadOptions                options_;
};

} // namespace trackq::pipeline
