#pragma once

#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

namespace inkvault::storage::common {

inline constexpr const char* kRecordExtension = ".pb";
inline constexpr const char* kBookmarksFile   = "bookmarks.pb";
inline constexpr const char* kLiveDirectory   = "live";
inline constexpr int         kIndexWidth      = 5;

// Image names become directory names, so they must be one plain component.
inline void ValidateImageName(const std::string& image_name) {
  if (image_name.empty()) {
    throw std::invalid_argument("image name must not be empty");
  }
  for (char c : image_name) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw std::invalid_argument("image name contains invalid character");
    }
  }
  if (image_name == "." || image_name == "..") {
    throw std::invalid_argument("image name must not be a relative path component");
  }
}

inline std::filesystem::path SessionRoot(const std::filesystem::path& storage_root, const std::string& image_name) {
  ValidateImageName(image_name);
  return storage_root / image_name;
}

// 47 -> "00047.pb"; wider indices keep all their digits.
inline std::string RecordFileName(uint64_t index) {
  std::ostringstream out;
  out << std::setw(kIndexWidth) << std::setfill('0') << index << kRecordExtension;
  return out.str();
}

inline std::filesystem::path RecordPath(const std::filesystem::path& session_root, uint64_t index) {
  return session_root / kLiveDirectory / RecordFileName(index);
}

/*
  Inverse of RecordFileName. Anything else living in the directory
  (temp files, editor droppings) yields nullopt.
*/
inline std::optional<uint64_t> ParseRecordFileName(const std::string& file_name) {
  const std::string ext = kRecordExtension;
  if (file_name.size() <= ext.size()) return std::nullopt;
  if (file_name.compare(file_name.size() - ext.size(), ext.size(), ext) != 0) return std::nullopt;

  const auto digits = file_name.substr(0, file_name.size() - ext.size());
  for (char c : digits) {
    if (c < '0' || c > '9') return std::nullopt;
  }
  try {
    return static_cast<uint64_t>(std::stoull(digits));
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

} // namespace inkvault::storage::common
