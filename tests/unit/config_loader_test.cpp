#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/config/defaults.hpp"
#include "internal/util/errors.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "pano_manager_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfig() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: debug
  file: "/tmp/pano.log"
detection:
  gap_threshold_seconds: 6
  raw_extensions: [".nef", ".cr2"]
workspace:
  project_dir: ".bursts"
tools:
  exiv2: /opt/exiv2/bin/exiv2
  hugin_bin_dir: /opt/hugin/bin
stitch:
  style: "vivid"
  projections: [rectilinear, "2"]
  adjust: true
)");

  auto config = pano::config::ConfigLoader::LoadFromYaml(yaml_path.string());

  assert(config.logging().level() == "debug");
  assert(config.logging().file() == "/tmp/pano.log");
  assert(pano::config::GapThreshold(config) == std::chrono::seconds(6));
  assert((pano::config::RawExtensions(config) == std::vector<std::string>{".nef", ".cr2"}));
  assert(pano::config::ProjectDir(config) == ".bursts");
  assert(pano::config::ArtifactName(config) == "bursts.pb");
  assert(pano::config::Exiv2Binary(config) == "/opt/exiv2/bin/exiv2");
  assert(pano::config::DarktableCliBinary(config) == "darktable-cli");
  assert(pano::config::HuginBinDir(config) == "/opt/hugin/bin");
  assert(config.stitch().style() == "vivid");
  assert((pano::config::Projections(config) == std::vector<std::string>{"rectilinear", "2"}));
  assert(config.stitch().adjust());
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(stitch:
  style_dir: "C:\\styles\\\"quoted\"\\dt"
)");

  auto config = pano::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.stitch().style_dir() == "C:\\styles\\\"quoted\"\\dt");
}

void TestScalarEscapingForNewlineAndUnicode() {
  const auto yaml_path = WriteYaml("newline_unicode",
                                   R"(stitch:
  style: "line1\nline2☃"
)");

  auto config = pano::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.stitch().style() == std::string("line1\nline2☃"));
}

void TestEmptyDocumentYieldsDefaults() {
  const auto yaml_path = WriteYaml("empty", "");

  auto config = pano::config::ConfigLoader::LoadFromYaml(yaml_path.string());

  assert(pano::config::GapThreshold(config) == pano::config::kDefaultGapThreshold);
  assert((pano::config::RawExtensions(config) == std::vector<std::string>{".raw", ".nef"}));
  assert(pano::config::ProjectDir(config) == ".pano");
  assert((pano::config::Projections(config) == std::vector<std::string>{"rectilinear"}));
  assert(pano::config::IntermediateFormat(config) == ".tif");
  assert(!config.stitch().adjust());
}

void TestStyleDirFollowsXdgConfigHome() {
  pano::runtime::config::RuntimeConfig config;

  setenv("XDG_CONFIG_HOME", "/xdg", 1);
  assert(pano::config::StyleDir(config) == std::filesystem::path("/xdg/darktable/styles"));

  config.mutable_stitch()->set_style_dir("/custom/styles");
  assert(pano::config::StyleDir(config) == std::filesystem::path("/custom/styles"));
  unsetenv("XDG_CONFIG_HOME");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(detection:
  gap_threshold_seconds: 4
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)pano::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const pano::util::InvalidArgument&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

bool RejectsYaml(const std::string& yaml) {
  try {
    (void)pano::config::ConfigLoader::LoadFromString(yaml);
  } catch (const pano::util::InvalidArgument&) {
    return true;
  }
  return false;
}

void TestValuesAreValidated() {
  assert(RejectsYaml("stitch:\n  projections: [fisheye]\n"));
  assert(RejectsYaml("stitch:\n  intermediate_format: tif\n"));
  assert(RejectsYaml("workspace:\n  artifact_name: ../bursts.pb\n"));
  assert(RejectsYaml("detection:\n  raw_extensions: [\"\"]\n"));
  assert(RejectsYaml("- just\n- a list\n"));

  auto config = pano::config::ConfigLoader::LoadFromString("stitch:\n  projections: [mercator, \"12\"]\n");
  assert(config.stitch().projections_size() == 2);
}

void TestMissingFileIsRejected() {
  bool threw = false;
  try {
    (void)pano::config::ConfigLoader::LoadFromYaml("/nonexistent/pano-manager.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw);
}

} // namespace

int main() {
  TestFullConfig();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestScalarEscapingForNewlineAndUnicode();
  TestEmptyDocumentYieldsDefaults();
  TestStyleDirFollowsXdgConfigHome();
  TestUnknownFieldsAreRejected();
  TestValuesAreValidated();
  TestMissingFileIsRejected();

  std::cout << "pano_manager_unit_config_loader: pass\n";
  return 0;
}
