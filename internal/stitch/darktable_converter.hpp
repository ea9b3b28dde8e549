#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "internal/runtime/tool_runner.hpp"

namespace pano::stitch {

// Stems of the *.dtstyle files in style_dir, sorted. Empty when the folder is missing.
std::vector<std::string> ListStyles(const std::filesystem::path& style_dir);

/*
  Develops RAW files with darktable-cli.

  Idempotent by path: an existing target is kept unless overwrite is set.
*/
class DarktableConverter {
 public:
  DarktableConverter(pano::runtime::ToolRunnerPtr runner, std::string binary, std::filesystem::path style_dir);

  // Returns false when the target already existed and was kept.
  // Throws util::InvalidArgument for an unknown style, util::ExternalToolFailure on failure.
  bool Convert(const std::filesystem::path& source, const std::filesystem::path& target, const std::string& style = {},
               bool overwrite = false) const;

  const std::filesystem::path& StyleDir() const {
    return style_dir_;
  }

 private:
  pano::runtime::ToolRunnerPtr runner_;
  std::string                  binary_;
  std::filesystem::path        style_dir_;
};

using DarktableConverterPtr = std::shared_ptr<DarktableConverter>;

} // namespace pano::stitch
