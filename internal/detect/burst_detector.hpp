#pragma once

#include <chrono>
#include <vector>

#include "internal/config/defaults.hpp"
#include "internal/model/capture_record.hpp"
#include "pano/manager/v1.hpp"

namespace pano::detect {

struct DetectorOptions {
  // Adjacent frames further apart than this start a new burst.
  std::chrono::seconds gap_threshold = pano::config::kDefaultGapThreshold;
};

/*
  Groups captures into panorama bursts.

  Pure function of (records, options):
    1. partition records into equal-settings classes, seeded in input order
    2. sort each class by capture time and split it wherever two neighbours
       are more than gap_threshold apart; split-off tails are appended after
       all classes
    3. drop single-frame groups

  Groups are never re-merged after the split.
*/
class BurstDetector {
 public:
  explicit BurstDetector(DetectorOptions options = {});

  // Throws util::MetadataUnavailable when any record lacks a capture time.
  pano::manager::v1::BurstCollection Detect(const std::vector<pano::model::CaptureRecord>& records) const;

  const DetectorOptions& Options() const {
    return options_;
  }

 private:
  DetectorOptions options_;
};

} // namespace pano::detect
