#include "hugin_stitcher.hpp"

#include <algorithm>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/stitch/projections.hpp"
#include "internal/util/errors.hpp"

namespace pano::stitch {

using namespace pano::manager::v1;
using pano::observability::IntField;
using pano::observability::PathField;
using pano::observability::StringField;

namespace {

bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.compare(0, prefix.size(), prefix) == 0;
}

std::vector<std::filesystem::path> ListByPrefix(const std::filesystem::path& dir, const std::string& prefix, const std::string& extension) {
  std::vector<std::filesystem::path> found;

  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) {
    return found;
  }

  for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
    const auto name = entry.path().filename().string();
    if (!entry.is_regular_file() || !StartsWith(name, prefix)) continue;
    if (!extension.empty() && entry.path().extension() != extension) continue;
    found.push_back(entry.path());
  }
  std::sort(found.begin(), found.end());
  return found;
}

} // namespace

std::string PanoramaName(const Burst& burst) {
  if (burst.frames().empty()) {
    throw pano::util::InvalidArgument("burst has no frames");
  }

  std::vector<std::string> ids;
  for (const auto& frame : burst.frames()) {
    ids.push_back(frame.id());
  }
  std::sort(ids.begin(), ids.end());
  return ids.front() + "-" + ids.back();
}

std::string OutputPrefix(const Burst& burst, const StitchOptions& options) {
  const auto style = options.style.empty() ? std::string("default") : options.style;
  return PanoramaName(burst) + "-" + style + "-" + (options.adjust ? "a" : "n");
}

std::vector<std::filesystem::path> FindPanoramas(const Burst& burst, const std::filesystem::path& dir) {
  return ListByPrefix(dir, PanoramaName(burst), {});
}

HuginStitcher::HuginStitcher(pano::runtime::ToolRunnerPtr runner, DarktableConverterPtr converter, std::filesystem::path bin_dir)
    : runner_(std::move(runner)), converter_(std::move(converter)), bin_dir_(std::move(bin_dir)) {
}

std::string HuginStitcher::Tool(const std::string& name) const {
  return bin_dir_.empty() ? name : (bin_dir_ / name).string();
}

void HuginStitcher::RunTool(const std::vector<std::string>& argv) const {
  PANO_LOG_INFO("Running stitch step", {StringField("tool", argv.front())});
  const auto result = runner_->Run(argv);
  if (!result.output.empty()) {
    PANO_LOG_DEBUG("Stitch step output", {StringField("tool", argv.front()), StringField("output", result.output)});
  }
  pano::runtime::ThrowIfToolFailed(result, argv);
}

std::vector<std::filesystem::path> HuginStitcher::Stitch(const Burst& burst, const std::filesystem::path& out_dir,
                                                         const std::filesystem::path& work_dir, const StitchOptions& options) const {
  const auto prefix = OutputPrefix(burst, options);

  // resolve every projection before touching any tool
  std::vector<int> projections;
  for (const auto& projection : options.projections) {
    projections.push_back(ProjectionIndex(projection));
  }
  if (projections.empty()) {
    projections.push_back(0);
  }

  std::vector<std::filesystem::path> outputs;
  std::vector<std::size_t>           pending;
  for (std::size_t i = 0; i < projections.size(); ++i) {
    outputs.push_back(out_dir / (prefix + "-" + ProjectionName(projections[i]) + ".tif"));
    if (!std::filesystem::is_regular_file(outputs.back())) {
      pending.push_back(i);
    }
  }

  if (pending.empty()) {
    PANO_LOG_INFO("Panorama exists, skipping", {StringField("prefix", prefix)});
    return outputs;
  }

  PANO_LOG_INFO("Starting panorama creation",
                {StringField("prefix", prefix), IntField("frames", burst.frames_size()), IntField("projections", static_cast<std::int64_t>(pending.size()))});

  std::vector<std::string> developed;
  for (const auto& frame : burst.frames()) {
    const std::filesystem::path source(frame.path());
    auto                        target = work_dir / (source.stem().string() + options.intermediate_format);
    converter_->Convert(source, target, options.style, /*overwrite=*/true);
    developed.push_back(target.string());
  }

  const auto pto = (work_dir / (prefix + ".pto")).string();

  std::vector<std::string> pto_gen = {Tool("pto_gen")};
  pto_gen.insert(pto_gen.end(), developed.begin(), developed.end());
  pto_gen.insert(pto_gen.end(), {"-o", pto});
  RunTool(pto_gen);

  RunTool({Tool("cpfind"), "--celeste", "-o", pto, pto});
  RunTool({Tool("cpclean"), "-o", pto, pto});
  RunTool({Tool("linefind"), "--lines", "3", "-o", pto, pto});
  RunTool({Tool("autooptimiser"), "-q", "-a", "-l", "-m", "-s", "-o", pto, pto});

  for (auto i : pending) {
    const auto& projection_name = ProjectionName(projections[i]);
    const auto  out_file        = outputs[i];

    RunTool({Tool("pano_modify"), "--projection", std::to_string(projections[i]), "--fov", "AUTO", "--canvas", "AUTO", "--straighten",
             "--center", "--crop", "0,100,0,100%", "--output-type", "NORMAL", "-o", pto, pto});

    if (options.adjust) {
      const std::vector<std::string> hugin = {Tool("hugin"), pto};
      const int                      rc    = runner_->RunInteractive(hugin);
      pano::runtime::ThrowIfToolFailed({rc, {}}, hugin);
    }

    // one remap prefix per projection so no stale layers get blended
    const auto remap_prefix = prefix + "-" + projection_name + "-layer";
    RunTool({Tool("nona"), "-g", "-z", "LZW", "-o", (work_dir / remap_prefix).string(), "--bigtiff", "-m", "TIFF_m", pto});

    const auto layers = ListByPrefix(work_dir, remap_prefix, ".tif");
    if (layers.empty()) {
      throw pano::util::ExternalToolFailure("nona", 0, "nona produced no images for " + projection_name);
    }

    std::vector<std::string> enblend = {Tool("enblend"), "-o", out_file.string()};
    for (const auto& layer : layers) {
      enblend.push_back(layer.string());
    }
    RunTool(enblend);

    if (!std::filesystem::is_regular_file(out_file)) {
      PANO_LOG_ERROR("Panorama not created", {PathField("output", out_file)});
      throw pano::util::ExternalToolFailure("enblend", 0, "panorama not created: " + out_file.string());
    }
    PANO_LOG_INFO("Panorama created", {PathField("output", out_file)});
  }

  return outputs;
}

} // namespace pano::stitch
