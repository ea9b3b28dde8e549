#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "config/config.pb.h"

namespace pano::config {

/*
  Effective settings.

  Every proto3 field left unset in the YAML file resolves to the value
  below, so an empty RuntimeConfig is a complete configuration.
*/

inline constexpr std::chrono::seconds kDefaultGapThreshold{4};

inline constexpr const char* kDefaultProjectDir         = ".pano";
inline constexpr const char* kDefaultArtifactName       = "bursts.pb";
inline constexpr const char* kDefaultExiv2              = "exiv2";
inline constexpr const char* kDefaultDarktableCli       = "darktable-cli";
inline constexpr const char* kDefaultIntermediateFormat = ".tif";
inline constexpr const char* kDefaultProjection         = "rectilinear";

std::chrono::seconds     GapThreshold(const pano::runtime::config::RuntimeConfig& config);
std::vector<std::string> RawExtensions(const pano::runtime::config::RuntimeConfig& config);

std::string ProjectDir(const pano::runtime::config::RuntimeConfig& config);
std::string ArtifactName(const pano::runtime::config::RuntimeConfig& config);

std::string           Exiv2Binary(const pano::runtime::config::RuntimeConfig& config);
std::string           DarktableCliBinary(const pano::runtime::config::RuntimeConfig& config);
std::filesystem::path HuginBinDir(const pano::runtime::config::RuntimeConfig& config);

// $XDG_CONFIG_HOME/darktable/styles, falling back to ~/.config.
std::filesystem::path    StyleDir(const pano::runtime::config::RuntimeConfig& config);
std::vector<std::string> Projections(const pano::runtime::config::RuntimeConfig& config);
std::string              IntermediateFormat(const pano::runtime::config::RuntimeConfig& config);

} // namespace pano::config
