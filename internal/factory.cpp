#include "factory.hpp"

#include "internal/config/defaults.hpp"
#include "internal/detect/burst_detector.hpp"
#include "internal/metadata/metadata_extractor.hpp"
#include "internal/storage/burst_store.hpp"
#include "internal/workspace/workspace.hpp"

namespace pano::factory {

Application Build(const pano::runtime::config::RuntimeConfig& config, const std::filesystem::path& root, runtime::ToolRunnerPtr runner) {
  Application app;

  if (!runner) {
    runner = std::make_shared<runtime::ShellToolRunner>();
  }

  // ------------------------------------------------------------------
  // Working directory
  // ------------------------------------------------------------------
  workspace::WorkspaceLayout layout;
  layout.project_dir    = config::ProjectDir(config);
  layout.artifact_name  = config::ArtifactName(config);
  layout.raw_extensions = config::RawExtensions(config);

  auto ws = workspace::Workspace::Open(root, std::move(layout));

  // ------------------------------------------------------------------
  // Detection
  // ------------------------------------------------------------------
  auto extractor = std::make_shared<metadata::ExifToolExtractor>(runner, config::Exiv2Binary(config));
  auto store     = std::make_shared<storage::BurstStore>(ws.ArtifactPath());

  detect::DetectorOptions detector_options;
  detector_options.gap_threshold = config::GapThreshold(config);

  // ------------------------------------------------------------------
  // External rendering
  // ------------------------------------------------------------------
  app.style_dir  = config::StyleDir(config);
  auto converter = std::make_shared<stitch::DarktableConverter>(runner, config::DarktableCliBinary(config), app.style_dir);
  auto stitcher  = std::make_shared<stitch::HuginStitcher>(runner, converter, config::HuginBinDir(config));

  app.stitch_defaults.style               = config.stitch().style();
  app.stitch_defaults.projections         = config::Projections(config);
  app.stitch_defaults.adjust              = config.stitch().adjust();
  app.stitch_defaults.intermediate_format = config::IntermediateFormat(config);

  app.manager = std::make_shared<core::BurstManager>(std::move(ws), std::move(extractor), std::move(store), detector_options,
                                                     std::move(stitcher), std::move(converter));
  return app;
}

} // namespace pano::factory
