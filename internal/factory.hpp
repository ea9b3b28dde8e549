#pragma once

#include <filesystem>
#include <memory>

#include "config/config.pb.h"

#include "internal/core/burst_manager.hpp"
#include "internal/runtime/tool_runner.hpp"
#include "internal/stitch/hugin_stitcher.hpp"

namespace pano::factory {

/*
  Application

  Everything one invocation needs, wired from the runtime config.
*/
struct Application {
  std::shared_ptr<core::BurstManager> manager;

  // stitch settings from the config; the CLI overrides them per call
  stitch::StitchOptions stitch_defaults;
  std::filesystem::path style_dir;
};

/*
  Build

  Composition root: the only place that knows the concrete extractor,
  store and tool implementations. A null runner selects ShellToolRunner.
*/
Application Build(const pano::runtime::config::RuntimeConfig& config, const std::filesystem::path& root,
                  runtime::ToolRunnerPtr runner = nullptr);

} // namespace pano::factory
