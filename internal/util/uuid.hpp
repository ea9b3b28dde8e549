#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace pano::util {

/*
  Random RFC4122 version 4 identifiers.

  Used to name private per-run working folders under the project folder,
  so two concurrent stitch runs never share intermediate files.
*/

using UUID = std::array<std::uint8_t, 16>;

UUID GenerateUUID();

// Canonical 8-4-4-4-12 lowercase hex form.
std::string ToString(const UUID& id);

// "<prefix>_<uuid>"
std::string WorkFolderName(std::string_view prefix);

} // namespace pano::util
