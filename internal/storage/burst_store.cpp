#include "burst_store.hpp"

#include <fstream>
#include <string>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace pano::storage {

using namespace pano::manager::v1;
using pano::observability::IntField;
using pano::observability::PathField;
using pano::observability::StringField;

namespace {

// A readable blob that violates collection invariants is treated as corrupt.
void ValidateCollection(const BurstCollection& collection, const std::filesystem::path& artifact) {
  for (int i = 0; i < collection.bursts_size(); ++i) {
    const auto& burst = collection.bursts(i);
    if (burst.frames_size() < 2) {
      throw pano::util::StorageCorrupt(artifact.string() + ": burst " + std::to_string(i) + " has fewer than 2 frames");
    }
    for (const auto& frame : burst.frames()) {
      if (frame.id().empty() || frame.path().empty()) {
        throw pano::util::StorageCorrupt(artifact.string() + ": burst " + std::to_string(i) + " has a frame without id or path");
      }
    }
  }
}

} // namespace

BurstStore::BurstStore(std::filesystem::path artifact) : artifact_(std::move(artifact)) {
}

bool BurstStore::Exists() const {
  std::error_code ec;
  return std::filesystem::is_regular_file(artifact_, ec);
}

BurstCollection BurstStore::Load() const {
  if (!Exists()) {
    throw pano::util::ArtifactMissing("no burst collection at " + artifact_.string());
  }

  std::ifstream in(artifact_, std::ios::binary);
  if (!in) {
    throw pano::util::StorageCorrupt("cannot open " + artifact_.string());
  }

  BurstCollection collection;
  if (!collection.ParseFromIstream(&in)) {
    throw pano::util::StorageCorrupt("cannot parse burst collection at " + artifact_.string());
  }
  ValidateCollection(collection, artifact_);

  PANO_LOG_INFO("Burst collection loaded", {PathField("path", artifact_), IntField("bursts", collection.bursts_size())});
  return collection;
}

/*
  Atomic write:
      write tmp → flush → rename
*/
void BurstStore::Save(const BurstCollection& collection) {
  std::error_code ec;
  std::filesystem::create_directories(artifact_.parent_path(), ec);
  if (ec) {
    throw pano::util::StorageError("cannot create " + artifact_.parent_path().string() + ": " + ec.message());
  }

  const auto tmp_path = common::TempPath(artifact_);
  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw pano::util::StorageError("cannot open " + tmp_path.string() + " for writing");
    }
    if (!collection.SerializeToOstream(&out)) {
      throw pano::util::StorageError("cannot serialize burst collection to " + tmp_path.string());
    }
    out.flush();
    if (!out) {
      throw pano::util::StorageError("write to " + tmp_path.string() + " failed");
    }
  }

  std::filesystem::rename(tmp_path, artifact_, ec);
  if (ec) {
    throw pano::util::StorageError("cannot replace " + artifact_.string() + ": " + ec.message());
  }

  PANO_LOG_INFO("Burst collection saved", {PathField("path", artifact_), IntField("bursts", collection.bursts_size())});
}

void BurstStore::Invalidate() {
  std::error_code ec;
  std::filesystem::remove(artifact_, ec);
  if (ec) {
    throw pano::util::StorageError("cannot remove " + artifact_.string() + ": " + ec.message());
  }
  PANO_LOG_INFO("Burst collection invalidated", {PathField("path", artifact_)});
}

BurstCollection BurstStore::Reject(BurstCollection collection, const std::set<std::size_t>& indices) {
  const auto size = static_cast<std::size_t>(collection.bursts_size());

  std::string out_of_range;
  for (auto index : indices) {
    if (index >= size) {
      out_of_range += (out_of_range.empty() ? "" : ", ") + std::to_string(index);
    }
  }
  if (!out_of_range.empty()) {
    throw pano::util::IndexOutOfRange("no burst at index " + out_of_range + " (collection has " + std::to_string(size) + ")");
  }

  // highest first so lower positions stay valid
  for (auto it = indices.rbegin(); it != indices.rend(); ++it) {
    collection.mutable_bursts()->DeleteSubrange(static_cast<int>(*it), 1);
  }
  return collection;
}

} // namespace pano::storage
