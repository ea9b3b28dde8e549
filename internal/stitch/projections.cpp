#include "projections.hpp"

#include <algorithm>
#include <cctype>

#include "internal/util/errors.hpp"

namespace pano::stitch {

const std::vector<std::string>& AvailableProjections() {
  static const std::vector<std::string> kProjections = {
      "rectilinear",
      "circular",
      "equirectangular",
      "fisheye_ff",
      "stereographic",
      "mercator",
      "trans_mercator",
      "sinusoidal",
      "lambert_equal_area_conic",
      "lambert_azimuthal",
      "albers_equal_area_conic",
      "miller_cylindrical",
      "panini",
      "architectural",
      "orthographic",
      "equisolid",
      "equi_panini",
      "biplane",
      "triplane",
      "panini_general",
      "thoby",
      "hammer",
  };
  return kProjections;
}

int ProjectionIndex(const std::string& name_or_id) {
  const auto& projections = AvailableProjections();

  if (!name_or_id.empty() && name_or_id.size() <= 3 && std::all_of(name_or_id.begin(), name_or_id.end(), [](unsigned char c) { return std::isdigit(c); })) {
    const auto index = std::stoul(name_or_id);
    if (index < projections.size()) {
      return static_cast<int>(index);
    }
    throw pano::util::InvalidArgument("projection id out of range: " + name_or_id);
  }

  auto it = std::find(projections.begin(), projections.end(), name_or_id);
  if (it == projections.end()) {
    throw pano::util::InvalidArgument("unknown projection: " + name_or_id);
  }
  return static_cast<int>(it - projections.begin());
}

const std::string& ProjectionName(int index) {
  const auto& projections = AvailableProjections();
  if (index < 0 || static_cast<std::size_t>(index) >= projections.size()) {
    throw pano::util::InvalidArgument("projection id out of range: " + std::to_string(index));
  }
  return projections[static_cast<std::size_t>(index)];
}

} // namespace pano::stitch
