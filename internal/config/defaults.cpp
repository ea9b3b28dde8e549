#include "defaults.hpp"

#include <cstdlib>

namespace pano::config {

using pano::runtime::config::RuntimeConfig;

namespace {

std::string OrDefault(const std::string& value, const char* fallback) {
  return value.empty() ? std::string(fallback) : value;
}

std::filesystem::path ConfigHome() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
    return xdg;
  }
  if (const char* home = std::getenv("HOME"); home && *home) {
    return std::filesystem::path(home) / ".config";
  }
  return std::filesystem::path(".config");
}

} // namespace

std::chrono::seconds GapThreshold(const RuntimeConfig& config) {
  if (config.detection().gap_threshold_seconds() == 0) {
    return kDefaultGapThreshold;
  }
  return std::chrono::seconds(config.detection().gap_threshold_seconds());
}

std::vector<std::string> RawExtensions(const RuntimeConfig& config) {
  if (config.detection().raw_extensions().empty()) {
    return {".raw", ".nef"};
  }
  return {config.detection().raw_extensions().begin(), config.detection().raw_extensions().end()};
}

std::string ProjectDir(const RuntimeConfig& config) {
  return OrDefault(config.workspace().project_dir(), kDefaultProjectDir);
}

std::string ArtifactName(const RuntimeConfig& config) {
  return OrDefault(config.workspace().artifact_name(), kDefaultArtifactName);
}

std::string Exiv2Binary(const RuntimeConfig& config) {
  return OrDefault(config.tools().exiv2(), kDefaultExiv2);
}

std::string DarktableCliBinary(const RuntimeConfig& config) {
  return OrDefault(config.tools().darktable_cli(), kDefaultDarktableCli);
}

std::filesystem::path HuginBinDir(const RuntimeConfig& config) {
  return config.tools().hugin_bin_dir();
}

std::filesystem::path StyleDir(const RuntimeConfig& config) {
  if (!config.stitch().style_dir().empty()) {
    return config.stitch().style_dir();
  }
  return ConfigHome() / "darktable" / "styles";
}

std::vector<std::string> Projections(const RuntimeConfig& config) {
  if (config.stitch().projections().empty()) {
    return {kDefaultProjection};
  }
  return {config.stitch().projections().begin(), config.stitch().projections().end()};
}

std::string IntermediateFormat(const RuntimeConfig& config) {
  return OrDefault(config.stitch().intermediate_format(), kDefaultIntermediateFormat);
}

} // namespace pano::config
