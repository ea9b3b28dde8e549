#pragma once

#include <string>
#include <vector>

namespace pano::stitch {

// Hugin projections; the position is the id passed to pano_modify --projection.
const std::vector<std::string>& AvailableProjections();

// Accepts a projection name or its numeric id. Throws util::InvalidArgument.
int                ProjectionIndex(const std::string& name_or_id);
const std::string& ProjectionName(int index);

} // namespace pano::stitch
