#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <set>

#include "pano/manager/v1.hpp"

namespace pano::storage {

/*
  Durable, index-addressed persistence of a BurstCollection.

  Lifecycle of the artifact:
    ABSENT  --Save-->        PRESENT
    PRESENT --Load/Save-->   PRESENT
    PRESENT --Invalidate-->  ABSENT

  Properties:
    - one serialized BurstCollection per file
    - atomic replace writes (tmp -> flush -> rename)
    - no locking; the last completed Save wins
*/
class BurstStore {
 public:
  explicit BurstStore(std::filesystem::path artifact);

  bool Exists() const;

  // Throws util::ArtifactMissing or util::StorageCorrupt.
  pano::manager::v1::BurstCollection Load() const;

  void Save(const pano::manager::v1::BurstCollection& collection);

  // Deletes the artifact so the next run detects again. No-op when absent.
  void Invalidate();

  /*
    Removes the bursts at the given positions.

    Positions refer to the collection as passed in, before any removal.
    Out-of-range positions throw util::IndexOutOfRange and remove nothing.
    The result is not persisted; call Save.
  */
  static pano::manager::v1::BurstCollection Reject(pano::manager::v1::BurstCollection collection, const std::set<std::size_t>& indices);

  const std::filesystem::path& ArtifactPath() const {
    return artifact_;
  }

 private:
  std::filesystem::path artifact_;
};

using BurstStorePtr = std::shared_ptr<BurstStore>;

} // namespace pano::storage
