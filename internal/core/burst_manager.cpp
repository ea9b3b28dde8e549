#include "burst_manager.hpp"

#include <system_error>

#include "internal/observability/logging.hpp"

namespace pano::core {

using namespace pano::manager::v1;
using pano::observability::IntField;
using pano::observability::PathField;
using pano::observability::StringField;

namespace {

std::string JoinIndices(const std::set<std::size_t>& indices) {
  std::string out;
  for (auto index : indices) {
    out += (out.empty() ? "" : ",") + std::to_string(index);
  }
  return out;
}

void MoveToDir(const std::filesystem::path& source, const std::filesystem::path& dir) {
  std::error_code ec;
  std::filesystem::rename(source, dir / source.filename(), ec);
  if (ec) {
    throw pano::util::StorageError("cannot move " + source.string() + " to " + dir.string() + ": " + ec.message());
  }
}

} // namespace

BurstManager::BurstManager(pano::workspace::Workspace workspace, pano::metadata::MetadataExtractorPtr extractor,
                           pano::storage::BurstStorePtr store, pano::detect::DetectorOptions detector_options,
                           pano::stitch::HuginStitcherPtr stitcher, pano::stitch::DarktableConverterPtr converter)
    : workspace_(std::move(workspace)),
      extractor_(std::move(extractor)),
      store_(std::move(store)),
      detector_(detector_options),
      stitcher_(std::move(stitcher)),
      converter_(std::move(converter)) {
}

const BurstCollection& BurstManager::Open() {
  if (store_->Exists()) {
    PANO_LOG_INFO("Burst collection found, loading existing data", {PathField("path", store_->ArtifactPath())});
    bursts_ = store_->Load();
  } else {
    PANO_LOG_INFO("Burst collection not found, scanning directory", {PathField("root", workspace_.Root())});
    Detect();
  }
  return bursts_;
}

const BurstCollection& BurstManager::Rescan() {
  store_->Invalidate();
  bursts_.Clear();
  Detect();
  return bursts_;
}

void BurstManager::Detect() {
  const auto paths   = workspace_.RawFiles();
  const auto records = extractor_->ExtractAll(paths);

  auto detected = detector_.Detect(records);
  store_->Save(detected);
  bursts_ = std::move(detected);
}

const Burst& BurstManager::At(std::size_t index) const {
  if (index >= static_cast<std::size_t>(bursts_.bursts_size())) {
    throw pano::util::IndexOutOfRange("no burst at index " + std::to_string(index) + " (collection has " +
                                      std::to_string(bursts_.bursts_size()) + ")");
  }
  return bursts_.bursts(static_cast<int>(index));
}

void BurstManager::Reject(const std::set<std::size_t>& indices) {
  auto updated = pano::storage::BurstStore::Reject(bursts_, indices);
  store_->Save(updated);
  bursts_ = std::move(updated);

  PANO_LOG_INFO("Rejected bursts", {StringField("indices", JoinIndices(indices)), IntField("remaining", bursts_.bursts_size())});
}

void BurstManager::Discard(const std::set<std::size_t>& indices) {
  // validates every index before any file moves
  auto updated = pano::storage::BurstStore::Reject(bursts_, indices);

  const auto trash = workspace_.TrashDir();
  for (auto index : indices) {
    for (const auto& frame : At(index).frames()) {
      const std::filesystem::path raw(frame.path());
      if (!std::filesystem::exists(raw)) {
        PANO_LOG_WARN("Frame already gone, nothing to discard", {PathField("path", raw)});
        continue;
      }
      MoveToDir(raw, trash);

      const auto xmp = pano::workspace::Workspace::XmpPath(raw);
      if (std::filesystem::exists(xmp)) {
        MoveToDir(xmp, trash);
      }
      PANO_LOG_INFO("Discarded photo", {StringField("id", frame.id()), PathField("trash", trash)});
    }
  }

  store_->Save(updated);
  bursts_ = std::move(updated);
}

std::vector<StitchOutcome> BurstManager::Stitch(const std::vector<std::size_t>& indices, const pano::stitch::StitchOptions& options) {
  std::vector<StitchOutcome> outcomes;
  outcomes.reserve(indices.size());

  for (auto index : indices) {
    StitchOutcome outcome;
    outcome.index = index;
    try {
      const auto& burst = At(index);
      const auto  work  = workspace_.MakeWorkDir("stitch");
      outcome.outputs   = stitcher_->Stitch(burst, workspace_.PanoramaDir(), work.Path(), options);
    } catch (const std::exception& e) {
      outcome.code    = pano::util::ErrorCodeOf(e);
      outcome.message = e.what();
      PANO_LOG_ERROR("Stitch failed", {IntField("index", static_cast<std::int64_t>(index)),
                                       StringField("code", pano::util::ErrorCodeName(outcome.code)), StringField("error", e.what())});
    }
    outcomes.push_back(std::move(outcome));
  }

  return outcomes;
}

std::vector<std::filesystem::path> BurstManager::DevelopJpeg(std::size_t index, const std::string& style, bool overwrite) {
  std::vector<std::filesystem::path> jpegs;
  for (const auto& frame : At(index).frames()) {
    auto target = workspace_.JpegPath(frame.id());
    converter_->Convert(frame.path(), target, style, overwrite);
    jpegs.push_back(std::move(target));
  }
  return jpegs;
}

std::vector<std::filesystem::path> BurstManager::Panoramas(std::size_t index) const {
  return pano::stitch::FindPanoramas(At(index), workspace_.PanoramaDir());
}

} // namespace pano::core
