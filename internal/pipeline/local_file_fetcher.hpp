#pragma once

#include "collaborators.hpp"

namespace trackq::pipeline {

// Streams a local file in fixed-size chunks. The locator is a file path.
class LocalFileFetcher final : public StreamFetcher {
 public:
  bool Fetch(const std::string& locator, uint64_t chunk_size, const ChunkSink& sink) override;
};

// Returns chunks unchanged.
class PassthroughDecryptor final : public Decryptor {
 public:
  std::string Decrypt(const std::string& chunk, uint64_t /*chunk_index*/, const std::string& /*key*/) override {
    return chunk;
  }
};

// Skips tagging; local files are expected to carry their own tags.
class NullTagger final : public Tagger {
 public:
  void Embed(const std::filesystem::path& /*file*/, const TrackMetadata& /*metadata*/) override {
  }
};

} // namespace trackq::pipeline
