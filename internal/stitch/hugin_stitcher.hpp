#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "internal/runtime/tool_runner.hpp"
#include "internal/stitch/darktable_converter.hpp"
#include "pano/manager/v1.hpp"

namespace pano::stitch {

struct StitchOptions {
  // darktable style applied while developing frames; none when empty
  std::string              style;
  std::vector<std::string> projections{"rectilinear"};
  // open the Hugin GUI before rendering each projection
  bool        adjust              = false;
  std::string intermediate_format = ".tif";
};

// "<first id>-<last id>" over the frame ids in name order.
std::string PanoramaName(const pano::manager::v1::Burst& burst);

// "<name>-<style>-<a|n>", shared prefix of every output of one stitch.
std::string OutputPrefix(const pano::manager::v1::Burst& burst, const StitchOptions& options);

// Existing files in dir whose name starts with PanoramaName(burst), sorted.
std::vector<std::filesystem::path> FindPanoramas(const pano::manager::v1::Burst& burst, const std::filesystem::path& dir);

/*
  Stitches a burst with the Hugin command line tools.

    develop frames → pto_gen → cpfind → cpclean → linefind → autooptimiser
    per projection: pano_modify → [hugin] → nona → enblend

  Idempotent by path: projections whose output already exists are skipped.
*/
class HuginStitcher {
 public:
  HuginStitcher(pano::runtime::ToolRunnerPtr runner, DarktableConverterPtr converter, std::filesystem::path bin_dir = {});

  // Returns one output per requested projection. Throws util::ExternalToolFailure.
  std::vector<std::filesystem::path> Stitch(const pano::manager::v1::Burst& burst, const std::filesystem::path& out_dir,
                                            const std::filesystem::path& work_dir, const StitchOptions& options) const;

 private:
  std::string Tool(const std::string& name) const;
  void        RunTool(const std::vector<std::string>& argv) const;

  pano::runtime::ToolRunnerPtr runner_;
  DarktableConverterPtr        converter_;
  std::filesystem::path        bin_dir_;
};

using HuginStitcherPtr = std::shared_ptr<HuginStitcher>;

} // namespace pano::stitch
