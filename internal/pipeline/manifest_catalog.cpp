#include "manifest_catalog.hpp"

#include <yaml-cpp/yaml.h>

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace trackq::pipeline {

namespace {

std::string Text(const YAML::Node& node, const char* key) {
  const auto value = node[key];
  return value ? value.as<std::string>() : std::string{};
}

std::vector<std::string> Ids(const YAML::Node& node, const char* key) {
  std::vector<std::string> ids;
  const auto               list = node[key];
  if (!list) return ids;
  if (!list.IsSequence()) {
    throw std::runtime_error(std::string("manifest field '") + key + "' must be a list");
  }
  for (const auto& id : list) {
    ids.push_back(id.as<std::string>());
  }
  return ids;
}

std::string RequireId(const YAML::Node& node, const char* section) {
  auto id = Text(node, "id");
  if (id.empty()) {
    throw std::runtime_error(std::string("manifest entry without id in '") + section + "'");
  }
  return id;
}

} // namespace

ManifestCatalog ManifestCatalog::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load catalog manifest: " + std::string(e.what()));
  }

  ManifestCatalog catalog;
  const auto      base = Text(yaml, "base_dir");
  catalog.base_dir_    = base.empty() ? std::filesystem::path(path).parent_path() : std::filesystem::path(base);

  try {
    for (const auto& node : yaml["tracks"]) {
      TrackEntry entry;
      entry.title        = Text(node, "title");
      entry.artist       = Text(node, "artist");
      entry.album        = Text(node, "album");
      entry.track_number = node["track_number"] ? node["track_number"].as<uint32_t>() : 0;
      entry.file         = Text(node, "file");
      entry.key          = Text(node, "key");
      entry.available    = node["available"] ? node["available"].as<bool>() : true;
      catalog.tracks_.emplace(RequireId(node, "tracks"), std::move(entry));
    }

    for (const auto& node : yaml["albums"]) {
      catalog.albums_.emplace(RequireId(node, "albums"), CollectionEntry{Text(node, "title"), Text(node, "artist"), Ids(node, "tracks")});
    }

    for (const auto& node : yaml["playlists"]) {
      catalog.playlists_.emplace(RequireId(node, "playlists"),
                                 CollectionEntry{Text(node, "title"), Text(node, "owner"), Ids(node, "tracks")});
    }

    for (const auto& node : yaml["artists"]) {
      catalog.artists_.emplace(RequireId(node, "artists"), CollectionEntry{Text(node, "name"), Text(node, "name"), Ids(node, "albums")});
    }
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Invalid catalog manifest: " + std::string(e.what()));
  }

  TRACKQ_LOG_INFO("catalog manifest loaded", {observability::StringField("path", path),
                                              observability::IntField("tracks", static_cast<int64_t>(catalog.tracks_.size())),
                                              observability::IntField("albums", static_cast<int64_t>(catalog.albums_.size()))});
  return catalog;
}

std::vector<ChildRef> ManifestCatalog::Children(const std::vector<std::string>& track_ids) const {
  std::vector<ChildRef> children;
  children.reserve(track_ids.size());

  uint32_t position = 0;
  for (const auto& track_id : track_ids) {
    ChildRef child;
    child.track_id = track_id;
    child.position = ++position;
    if (auto it = tracks_.find(track_id); it != tracks_.end()) {
      child.title  = it->second.title;
      child.artist = it->second.artist;
    }
    children.push_back(std::move(child));
  }
  return children;
}

ResolvedItem ManifestCatalog::Resolve(const std::string& id, trackq::v1::ItemType type) {
  ResolvedItem resolved;

  switch (type) {
    case trackq::v1::ITEM_TYPE_TRACK: {
      auto it = tracks_.find(id);
      if (it == tracks_.end()) {
        throw util::ContentUnavailable("track not in catalog: " + id);
      }
      const auto& track = it->second;
      if (!track.available || track.file.empty()) {
        throw util::ContentUnavailable("track not available for download: " + id);
      }
      resolved.title           = track.title;
      resolved.artist          = track.artist;
      resolved.album           = track.album;
      resolved.track_number    = track.track_number;
      resolved.stream_locator  = (base_dir_ / track.file).string();
      resolved.decryption_key  = track.key;
      return resolved;
    }

    case trackq::v1::ITEM_TYPE_ALBUM: {
      auto it = albums_.find(id);
      if (it == albums_.end()) {
        throw util::ContentUnavailable("album not in catalog: " + id);
      }
      resolved.title    = it->second.title;
      resolved.artist   = it->second.artist;
      resolved.album    = it->second.title;
      resolved.children = Children(it->second.members);
      return resolved;
    }

    case trackq::v1::ITEM_TYPE_PLAYLIST: {
      auto it = playlists_.find(id);
      if (it == playlists_.end()) {
        throw util::ContentUnavailable("playlist not in catalog: " + id);
      }
      resolved.title    = it->second.title;
      resolved.artist   = it->second.artist;
      resolved.children = Children(it->second.members);
      return resolved;
    }

    case trackq::v1::ITEM_TYPE_ARTIST: {
      auto it = artists_.find(id);
      if (it == artists_.end()) {
        throw util::ContentUnavailable("artist not in catalog: " + id);
      }
      std::vector<std::string> track_ids;
      for (const auto& album_id : it->second.members) {
        auto album = albums_.find(album_id);
        if (album == albums_.end()) continue;
        track_ids.insert(track_ids.end(), album->second.members.begin(), album->second.members.end());
      }
      resolved.title    = it->second.title;
      resolved.artist   = it->second.artist;
      resolved.children = Children(track_ids);
      return resolved;
    }

    default:
      throw util::ContentUnavailable("unsupported item type for " + id);
  }
}

} // namespace trackq::pipeline
