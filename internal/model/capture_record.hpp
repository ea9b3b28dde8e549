#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>

#include "internal/util/time.hpp"

namespace pano::model {

// attribute name (final key component) -> raw value as reported by the camera
using Settings = std::map<std::string, std::string>;

/*
  Normalized metadata of one source capture.

  - id is the file stem and unique within a working directory.
  - Two records belong to the same equal-settings class iff their
    settings maps compare equal.
*/
struct CaptureRecord {
  std::string           id;
  std::filesystem::path path;
  Settings              settings;

  // Unset only when the source reported no usable DateTimeOriginal.
  std::optional<pano::util::TimePoint> captured_at;
};

} // namespace pano::model
