#include "output_path.hpp"

#include <cstdio>

namespace trackq::pipeline {

namespace {

constexpr const char* kUnknown        = "unknown";
constexpr const char* kVariousArtists = "Various Artists";

std::string Trim(const std::string& value) {
  const auto first = value.find_first_not_of(" .");
  if (first == std::string::npos) return {};
  const auto last = value.find_last_not_of(" .");
  return value.substr(first, last - first + 1);
}

} // namespace

std::string SanitizeFileName(const std::string& name) {
  std::string sanitized;
  sanitized.reserve(name.size());
  for (const char c : name) {
    switch (c) {
      case '/':
      case '\\':
      case ':':
      case '*':
      case '?':
      case '"':
      case '<':
      case '>':
      case '|':
        sanitized.push_back('_');
        break;
      case '\0':
        break;
      default:
        if (static_cast<unsigned char>(c) >= 0x20) sanitized.push_back(c);
        break;
    }
  }

  sanitized = Trim(sanitized);
  return sanitized.empty() ? kUnknown : sanitized;
}

std::string ExtensionFor(const std::string& quality) {
  return quality == "FLAC" ? ".flac" : ".mp3";
}

std::filesystem::path ItemFolder(const std::filesystem::path& root, trackq::v1::ItemType type, const std::string& artist,
                                 const std::string& album, const std::string& title) {
  switch (type) {
    case trackq::v1::ITEM_TYPE_PLAYLIST:
      return root / kVariousArtists / SanitizeFileName(title);
    case trackq::v1::ITEM_TYPE_ARTIST:
      return root / SanitizeFileName(artist.empty() ? title : artist);
    default:
      return root / SanitizeFileName(artist) / SanitizeFileName(album);
  }
}

std::string TrackFileName(trackq::v1::ItemType parent_type, uint32_t number, const std::string& artist, const std::string& title,
                          const std::string& quality) {
  char prefix[16];
  std::snprintf(prefix, sizeof(prefix), "%02u", number);

  std::string name = prefix;
  name += " - ";
  if (parent_type == trackq::v1::ITEM_TYPE_PLAYLIST) {
    name += SanitizeFileName(artist) + " - ";
  }
  name += SanitizeFileName(title);
  return name + ExtensionFor(quality);
}

} // namespace trackq::pipeline
