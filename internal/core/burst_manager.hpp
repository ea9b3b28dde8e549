#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "internal/detect/burst_detector.hpp"
#include "internal/metadata/metadata_extractor.hpp"
#include "internal/stitch/darktable_converter.hpp"
#include "internal/stitch/hugin_stitcher.hpp"
#include "internal/storage/burst_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/workspace/workspace.hpp"
#include "pano/manager/v1.hpp"

namespace pano::core {

// Result of one burst in a batch operation.
struct StitchOutcome {
  std::size_t                        index = 0;
  pano::util::ErrorCode              code  = pano::util::ErrorCode::OK;
  std::string                        message;
  std::vector<std::filesystem::path> outputs;

  explicit operator bool() const {
    return code == pano::util::ErrorCode::OK;
  }
};

/*
  Owns the in-memory burst collection of one working directory.

  Open() loads the persisted collection, or on first use scans the RAW
  files, detects bursts and persists them. Every mutation is saved before
  the call returns.
*/
class BurstManager {
 public:
  BurstManager(pano::workspace::Workspace workspace, pano::metadata::MetadataExtractorPtr extractor, pano::storage::BurstStorePtr store,
               pano::detect::DetectorOptions detector_options, pano::stitch::HuginStitcherPtr stitcher,
               pano::stitch::DarktableConverterPtr converter);

  const pano::manager::v1::BurstCollection& Open();

  // Drops the persisted collection and detects again from the RAW files.
  const pano::manager::v1::BurstCollection& Rescan();

  const pano::manager::v1::BurstCollection& Bursts() const {
    return bursts_;
  }

  // Throws util::IndexOutOfRange.
  const pano::manager::v1::Burst& At(std::size_t index) const;

  // Removes bursts by their current positions and saves. All-or-nothing.
  void Reject(const std::set<std::size_t>& indices);

  // Moves the RAW files (and sidecars) of the bursts to Trash, then rejects them.
  void Discard(const std::set<std::size_t>& indices);

  // Stitches each burst in turn; a failing burst does not stop the others.
  std::vector<StitchOutcome> Stitch(const std::vector<std::size_t>& indices, const pano::stitch::StitchOptions& options);

  // Develops every frame of a burst into Jpeg/. Returns the JPEG paths.
  std::vector<std::filesystem::path> DevelopJpeg(std::size_t index, const std::string& style = {}, bool overwrite = false);

  std::vector<std::filesystem::path> Panoramas(std::size_t index) const;

  const pano::workspace::Workspace& Dir() const {
    return workspace_;
  }

 private:
  void Detect();

  pano::workspace::Workspace           workspace_;
  pano::metadata::MetadataExtractorPtr extractor_;
  pano::storage::BurstStorePtr         store_;
  pano::detect::BurstDetector          detector_;
  pano::stitch::HuginStitcherPtr       stitcher_;
  pano::stitch::DarktableConverterPtr  converter_;

  pano::manager::v1::BurstCollection bursts_;
};

} // namespace pano::core
