#pragma once

#include <filesystem>
#include <string>

#include "internal/util/errors.hpp"

namespace pano::storage::common {

inline void ValidateArtifactName(const std::string& name) {
  if (name.empty()) {
    throw pano::util::InvalidArgument("artifact name must not be empty");
  }
  for (char c : name) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw pano::util::InvalidArgument("artifact name contains invalid character");
    }
  }
  if (name == "." || name == "..") {
    throw pano::util::InvalidArgument("artifact name must not be a relative path component");
  }
}

inline std::filesystem::path ArtifactPath(const std::filesystem::path& project_dir, const std::string& name) {
  ValidateArtifactName(name);
  return project_dir / name;
}

// Sibling used for write-then-rename replacement.
inline std::filesystem::path TempPath(const std::filesystem::path& artifact) {
  return std::filesystem::path(artifact.string() + ".tmp");
}

} // namespace pano::storage::common
