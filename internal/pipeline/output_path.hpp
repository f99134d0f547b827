#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "trackq/v1/queue.pb.h"

namespace trackq::pipeline {

// Replaces characters invalid in file names; never returns an empty string.
std::string SanitizeFileName(const std::string& name);

// ".flac" for FLAC, ".mp3" otherwise.
std::string ExtensionFor(const std::string& quality);

/*
  Folder of an item:
    track / album : <root>/<artist>/<album>
    playlist      : <root>/Various Artists/<title>
    artist        : <root>/<artist>
*/
std::filesystem::path ItemFolder(const std::filesystem::path& root, trackq::v1::ItemType type, const std::string& artist,
                                 const std::string& album, const std::string& title);

// "NN - title.ext", or "NN - artist - title.ext" inside playlists.
std::string TrackFileName(trackq::v1::ItemType parent_type, uint32_t number, const std::string& artist, const std::string& title,
                          const std::string& quality);

} // namespace trackq::pipeline
