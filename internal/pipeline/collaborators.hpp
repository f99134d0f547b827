#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "trackq/v1/queue.pb.h"

namespace trackq::pipeline {

/*
  Interfaces of the external collaborators the engine drives.

  Implementations report failures with the pipeline errors of
  internal/util/errors.hpp; anything else is treated as terminal.
*/

struct ChildRef {
  std::string track_id;
  std::string title;
  std::string artist;
  uint32_t    position = 0;
};

struct ResolvedItem {
  std::string title;
  std::string artist;
  std::string album;
  uint32_t    track_number = 0;

  // composite items only, in download order
  std::vector<ChildRef> children;

  // leaf items only
  std::string stream_locator;
  std::string decryption_key;
  uint64_t    size_hint_bytes = 0;
};

class CatalogClient {
 public:
  virtual ~CatalogClient() = default;

  // Throws ContentUnavailable, AuthError or TransientError.
  virtual ResolvedItem Resolve(const std::string& id, trackq::v1::ItemType type) = 0;
};

/*
  Receives one encrypted chunk and the total stream size (0 if unknown).
  Returning false stops the transfer.
*/
using ChunkSink = std::function<bool(const std::string& chunk, uint64_t total_bytes)>;

class StreamFetcher {
 public:
  virtual ~StreamFetcher() = default;

  // Returns false if the sink stopped the transfer early.
  virtual bool Fetch(const std::string& locator, uint64_t chunk_size, const ChunkSink& sink) = 0;
};

class Decryptor {
 public:
  virtual ~Decryptor() = default;

  // Throws DecryptionError.
  virtual std::string Decrypt(const std::string& chunk, uint64_t chunk_index, const std::string& key) = 0;
};

struct TrackMetadata {
  std::string title;
  std::string artist;
  std::string album;
  uint32_t    track_number = 0;
  std::string quality;
};

class Tagger {
 public:
  virtual ~Tagger() = default;

  virtual void Embed(const std::filesystem::path& file, const TrackMetadata& metadata) = 0;
};

} // namespace trackq::pipeline
