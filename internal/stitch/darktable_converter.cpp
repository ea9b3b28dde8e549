#include "darktable_converter.hpp"

#include <algorithm>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace pano::stitch {

using pano::observability::PathField;
using pano::observability::StringField;

std::vector<std::string> ListStyles(const std::filesystem::path& style_dir) {
  std::vector<std::string> styles;

  std::error_code ec;
  if (!std::filesystem::is_directory(style_dir, ec)) {
    return styles;
  }

  for (const auto& entry : std::filesystem::directory_iterator(style_dir, ec)) {
    if (entry.is_regular_file() && entry.path().extension() == ".dtstyle") {
      styles.push_back(entry.path().stem().string());
    }
  }
  std::sort(styles.begin(), styles.end());
  return styles;
}

DarktableConverter::DarktableConverter(pano::runtime::ToolRunnerPtr runner, std::string binary, std::filesystem::path style_dir)
    : runner_(std::move(runner)), binary_(std::move(binary)), style_dir_(std::move(style_dir)) {
}

bool DarktableConverter::Convert(const std::filesystem::path& source, const std::filesystem::path& target, const std::string& style,
                                 bool overwrite) const {
  if (!overwrite && std::filesystem::is_regular_file(target)) {
    PANO_LOG_INFO("Conversion skipped, target exists", {PathField("target", target)});
    return false;
  }

  std::vector<std::string> argv = {binary_, source.string(), target.string()};
  if (!style.empty()) {
    const auto styles = ListStyles(style_dir_);
    if (std::find(styles.begin(), styles.end(), style) == styles.end()) {
      PANO_LOG_ERROR("Invalid darktable style", {StringField("style", style), PathField("style_dir", style_dir_)});
      throw pano::util::InvalidArgument("darktable style not found: " + style);
    }
    argv.insert(argv.end(), {"--style-overwrite", "--style", style});
  }

  PANO_LOG_INFO("Converting photo", {PathField("source", source), PathField("target", target),
                                     StringField("style", style.empty() ? "none" : style)});

  // darktable-cli never replaces an existing file
  std::error_code ec;
  std::filesystem::remove(target, ec);

  const auto result = runner_->Run(argv);
  pano::runtime::ThrowIfToolFailed(result, argv);

  if (!std::filesystem::is_regular_file(target)) {
    PANO_LOG_ERROR("Conversion failed", {PathField("target", target)});
    throw pano::util::ExternalToolFailure(binary_, result.exit_code, "conversion produced no file: " + target.string());
  }
  return true;
}

} // namespace pano::stitch
