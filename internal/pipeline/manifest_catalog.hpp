#pragma once

#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

#include "collaborators.hpp"

namespace trackq::pipeline {

/*
  Catalog backed by a local YAML manifest.

    base_dir: /srv/music        # optional, defaults to the manifest folder
    tracks:
      - {id: "t1", title: "...", artist: "...", album: "...", track_number: 1, file: "t1.mp3"}
    albums:
      - {id: "a1", title: "...", artist: "...", tracks: ["t1", "t2"]}
    playlists:
      - {id: "p1", title: "...", tracks: ["t2", "t1"]}
    artists:
      - {id: "ar1", name: "...", albums: ["a1"]}

  Tracks may set `available: false` or an encryption `key`. Immutable after
  loading, so Resolve is safe from any thread.
*/
class ManifestCatalog final : public CatalogClient {
 public:
  static ManifestCatalog LoadFromYaml(const std::string& path);

  ResolvedItem Resolve(const std::string& id, trackq::v1::ItemType type) override;

  std::size_t TrackCount() const {
    return tracks_.size();
  }

 private:
  struct TrackEntry {
    std::string title;
    std::string artist;
    std::string album;
    uint32_t    track_number = 0;
    std::string file;
    std::string key;
    bool        available = true;
  };

  struct CollectionEntry {
    std::string              title;
    std::string              artist;
    std::vector<std::string> members;
  };

  std::vector<ChildRef> Children(const std::vector<std::string>& track_ids) const;

  std::filesystem::path                            base_dir_;
  std::unordered_map<std::string, TrackEntry>      tracks_;
  std::unordered_map<std::string, CollectionEntry> albums_;
  std::unordered_map<std::string, CollectionEntry> playlists_;
  std::unordered_map<std::string, CollectionEntry> artists_;
};

} // namespace trackq::pipeline
