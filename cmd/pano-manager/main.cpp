#include <cstdlib>
#include <iostream>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/stitch/darktable_converter.hpp"
#include "internal/stitch/hugin_stitcher.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "pano/manager/v1.hpp"

using namespace pano::manager::v1;

namespace {

constexpr int kExitOk      = 0;
constexpr int kExitUsage   = 1;
constexpr int kExitFatal   = 2;
constexpr int kExitPartial = 3;

void Usage() {
  std::cout << "Usage: pano-manager [--config=<file.yaml>] [--verbose] <workdir> <command> [args]\n\n"
            << "Commands:\n"
            << "  list\n"
            << "  show <index>\n"
            << "  reject <index>...\n"
            << "  discard <index>...\n"
            << "  stitch <index>... [--style=S] [--projection=P]... [--adjust]\n"
            << "  jpeg <index> [--style=S] [--overwrite]\n"
            << "  panoramas <index>\n"
            << "  rescan\n"
            << "  styles\n";
}

bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.compare(0, prefix.size(), prefix) == 0;
}

std::optional<std::size_t> ParseIndex(const std::string& value) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
    return std::nullopt;
  }
  try {
    return static_cast<std::size_t>(std::stoull(value));
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

struct Invocation {
  std::string              config_path;
  std::string              workdir;
  std::string              command;
  std::vector<std::size_t> indices;
  std::vector<std::string> flags;
  bool                     verbose = false;
};

std::optional<Invocation> ParseArgs(int argc, char** argv) {
  Invocation inv;
  int        i = 1;

  // global options precede the working directory
  for (; i < argc && StartsWith(argv[i], "-"); ++i) {
    const std::string arg = argv[i];
    if (StartsWith(arg, "--config=")) {
      inv.config_path = arg.substr(9);
    } else if (arg == "--config" && i + 1 < argc) {
      inv.config_path = argv[++i];
    } else if (arg == "--verbose" || arg == "-v") {
      inv.verbose = true;
    } else {
      std::cerr << "unknown option: " << arg << "\n";
      return std::nullopt;
    }
  }

  if (argc - i < 2) {
    return std::nullopt;
  }
  inv.workdir = argv[i++];
  inv.command = argv[i++];

  for (; i < argc; ++i) {
    const std::string arg = argv[i];
    if (StartsWith(arg, "--")) {
      inv.flags.push_back(arg);
      continue;
    }
    auto index = ParseIndex(arg);
    if (!index) {
      std::cerr << "invalid burst index: " << arg << "\n";
      return std::nullopt;
    }
    inv.indices.push_back(*index);
  }
  return inv;
}

std::optional<std::string> FlagValue(const Invocation& inv, const std::string& key) {
  const auto prefix = "--" + key + "=";
  for (const auto& flag : inv.flags) {
    if (StartsWith(flag, prefix)) return flag.substr(prefix.size());
  }
  return std::nullopt;
}

std::vector<std::string> FlagValues(const Invocation& inv, const std::string& key) {
  const auto               prefix = "--" + key + "=";
  std::vector<std::string> values;
  for (const auto& flag : inv.flags) {
    if (StartsWith(flag, prefix)) values.push_back(flag.substr(prefix.size()));
  }
  return values;
}

bool HasFlag(const Invocation& inv, const std::string& key) {
  const auto flag = "--" + key;
  for (const auto& f : inv.flags) {
    if (f == flag) return true;
  }
  return false;
}

void PrintBurstLine(std::size_t index, const Burst& burst) {
  const auto& first = burst.frames(0);
  const auto& last  = burst.frames(burst.frames_size() - 1);
  const auto  span  = pano::util::Elapsed(first.captured_at(), last.captured_at()).count();

  std::cout << index << "\t" << burst.frames_size() << " frames\t" << first.id() << " .. " << last.id() << "\t"
            << pano::util::FormatExifDateTime(pano::util::FromProto(first.captured_at())) << "\t+" << span << "s\n";
}

void PrintBurst(const Burst& burst) {
  for (const auto& frame : burst.frames()) {
    std::cout << pano::util::FormatExifDateTime(pano::util::FromProto(frame.captured_at())) << "\t" << frame.id() << "\t" << frame.path()
              << "\n";
  }
}

int Run(const Invocation& inv, const pano::runtime::config::RuntimeConfig& config) {
  auto  app     = pano::factory::Build(config, inv.workdir);
  auto& manager = *app.manager;

  if (inv.command == "styles") {
    for (const auto& style : pano::stitch::ListStyles(app.style_dir)) {
      std::cout << style << "\n";
    }
    return kExitOk;
  }

  if (inv.command == "rescan") {
    const auto& bursts = manager.Rescan();
    for (int i = 0; i < bursts.bursts_size(); ++i) PrintBurstLine(static_cast<std::size_t>(i), bursts.bursts(i));
    return kExitOk;
  }

  const auto& bursts = manager.Open();

  if (inv.command == "list") {
    for (int i = 0; i < bursts.bursts_size(); ++i) PrintBurstLine(static_cast<std::size_t>(i), bursts.bursts(i));
    return kExitOk;
  }

  if (inv.indices.empty()) {
    Usage();
    return kExitUsage;
  }

  if (inv.command == "show") {
    PrintBurst(manager.At(inv.indices.front()));
    return kExitOk;
  }

  if (inv.command == "reject" || inv.command == "discard") {
    const std::set<std::size_t> indices(inv.indices.begin(), inv.indices.end());
    if (inv.command == "reject") {
      manager.Reject(indices);
    } else {
      manager.Discard(indices);
    }
    std::cout << manager.Bursts().bursts_size() << " bursts remaining\n";
    return kExitOk;
  }

  if (inv.command == "stitch") {
    auto options = app.stitch_defaults;
    if (auto style = FlagValue(inv, "style")) options.style = *style;
    if (auto projections = FlagValues(inv, "projection"); !projections.empty()) options.projections = projections;
    if (HasFlag(inv, "adjust")) options.adjust = true;

    int failed = 0;
    for (const auto& outcome : manager.Stitch(inv.indices, options)) {
      if (!outcome) {
        ++failed;
        std::cerr << outcome.index << "\t" << pano::util::ErrorCodeName(outcome.code) << "\t" << outcome.message << "\n";
        continue;
      }
      for (const auto& output : outcome.outputs) {
        std::cout << outcome.index << "\t" << output.string() << "\n";
      }
    }
    return failed == 0 ? kExitOk : kExitPartial;
  }

  if (inv.command == "jpeg") {
    const auto style = FlagValue(inv, "style").value_or(app.stitch_defaults.style);
    for (const auto& jpeg : manager.DevelopJpeg(inv.indices.front(), style, HasFlag(inv, "overwrite"))) {
      std::cout << jpeg.string() << "\n";
    }
    return kExitOk;
  }

  if (inv.command == "panoramas") {
    for (const auto& pano : manager.Panoramas(inv.indices.front())) {
      std::cout << pano.string() << "\n";
    }
    return kExitOk;
  }

  std::cerr << "unknown command: " << inv.command << "\n";
  Usage();
  return kExitUsage;
}

} // namespace

int main(int argc, char** argv) {
  auto inv = ParseArgs(argc, argv);
  if (!inv) {
    Usage();
    return kExitUsage;
  }

  // spdlog's own default logger writes to stdout, which carries command output
  pano::observability::InitializeBootstrapLogging();

  pano::runtime::config::RuntimeConfig config;
  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    if (!inv->config_path.empty()) {
      config = pano::config::ConfigLoader::LoadFromYaml(inv->config_path);
    }
    pano::observability::InitializeLogging(config);
    if (inv->verbose) {
      pano::observability::SetLogLevel(spdlog::level::debug);
    }

    // ------------------------------------------------------------
    // Build application and run the command
    // ------------------------------------------------------------

    const int rc = Run(*inv, config);
    pano::observability::ShutdownLogging();
    return rc;
  } catch (const std::exception& e) {
    PANO_LOG_ERROR("Fatal error", {pano::observability::StringField("error", e.what()),
                                   pano::observability::StringField("code", pano::util::ErrorCodeName(pano::util::ErrorCodeOf(e)))});
    std::cerr << e.what() << "\n";
    pano::observability::ShutdownLogging();
    return kExitFatal;
  }
}
