#pragma once

#include "pano/manager/v1/burst.pb.h"

namespace pano::manager::v1 {
// Umbrella header for the persisted burst types.
}
