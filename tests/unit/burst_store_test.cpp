#include <google/protobuf/util/message_differencer.h>

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/storage/burst_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using google::protobuf::util::MessageDifferencer;
using pano::manager::v1::Burst;
using pano::manager::v1::BurstCollection;
using pano::storage::BurstStore;

std::filesystem::path TestDir(const std::string& test_name) {
  const auto dir = std::filesystem::temp_directory_path() / "pano_manager_burst_store_tests" / test_name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

Burst MakeBurst(const std::string& first, const std::string& second) {
  const auto t = *pano::util::ParseExifDateTime("2023:06:01 12:00:00");

  Burst burst;
  auto* a = burst.add_frames();
  a->set_id(first);
  a->set_path("/photos/" + first + ".nef");
  *a->mutable_captured_at() = pano::util::ToProto(t);

  auto* b = burst.add_frames();
  b->set_id(second);
  b->set_path("/photos/" + second + ".nef");
  *b->mutable_captured_at() = pano::util::ToProto(t + std::chrono::seconds(2));
  return burst;
}

// bursts "0-a".."n-b", named by original position
BurstCollection MakeCollection(int n) {
  BurstCollection collection;
  for (int i = 0; i < n; ++i) {
    *collection.add_bursts() = MakeBurst(std::to_string(i) + "-a", std::to_string(i) + "-b");
  }
  return collection;
}

std::string FirstId(const BurstCollection& collection, int index) {
  return collection.bursts(index).frames(0).id();
}

void TestSaveThenLoadRoundTrips() {
  const auto dir = TestDir("round_trip");
  BurstStore store(dir / ".pano" / "bursts.pb");

  assert(!store.Exists());
  const auto collection = MakeCollection(3);
  store.Save(collection);

  assert(store.Exists());
  assert(!std::filesystem::exists(dir / ".pano" / "bursts.pb.tmp"));
  assert(MessageDifferencer::Equals(store.Load(), collection));
}

void TestEmptyCollectionRoundTrips() {
  const auto dir = TestDir("empty");
  BurstStore store(dir / "bursts.pb");

  store.Save(BurstCollection{});
  assert(store.Exists());
  assert(store.Load().bursts_size() == 0);
}

void TestLoadMissingArtifact() {
  const auto dir = TestDir("missing");
  BurstStore store(dir / "bursts.pb");

  bool threw = false;
  try {
    (void)store.Load();
  } catch (const pano::util::ArtifactMissing&) {
    threw = true;
  }
  assert(threw);
}

void TestLoadCorruptArtifact() {
  const auto dir = TestDir("corrupt");
  {
    std::ofstream out(dir / "bursts.pb", std::ios::binary);
    // field 1 with the invalid wire type 7
    out << "\x0f not a protobuf";
  }
  BurstStore store(dir / "bursts.pb");

  bool threw = false;
  try {
    (void)store.Load();
  } catch (const pano::util::StorageCorrupt&) {
    threw = true;
  }
  assert(threw);
}

void TestLoadRejectsSingleFrameBurst() {
  const auto dir = TestDir("single_frame");
  BurstStore store(dir / "bursts.pb");

  BurstCollection collection;
  auto            burst = MakeBurst("a", "b");
  burst.mutable_frames()->RemoveLast();
  *collection.add_bursts() = burst;
  store.Save(collection);

  bool threw = false;
  try {
    (void)store.Load();
  } catch (const pano::util::StorageCorrupt&) {
    threw = true;
  }
  assert(threw);
}

void TestInvalidate() {
  const auto dir = TestDir("invalidate");
  BurstStore store(dir / "bursts.pb");

  store.Save(MakeCollection(1));
  store.Invalidate();
  assert(!store.Exists());

  // absent artifact is a no-op
  store.Invalidate();
}

void TestRejectSingle() {
  auto result = BurstStore::Reject(MakeCollection(3), {1});

  assert(result.bursts_size() == 2);
  assert(FirstId(result, 0) == "0-a");
  assert(FirstId(result, 1) == "2-a");
}

void TestRejectBatchUsesSnapshotPositions() {
  auto result = BurstStore::Reject(MakeCollection(5), {0, 2, 4});

  assert(result.bursts_size() == 2);
  assert(FirstId(result, 0) == "1-a");
  assert(FirstId(result, 1) == "3-a");
}

void TestRejectOutOfRangeRemovesNothing() {
  const auto collection = MakeCollection(3);

  bool threw = false;
  try {
    (void)BurstStore::Reject(collection, {1, 3});
  } catch (const pano::util::IndexOutOfRange& e) {
    threw = true;
    assert(std::string(e.what()).find('3') != std::string::npos);
  }
  assert(threw);
  assert(collection.bursts_size() == 3);
}

void TestRejectEmptySetIsNoop() {
  const auto collection = MakeCollection(2);
  assert(MessageDifferencer::Equals(BurstStore::Reject(collection, {}), collection));
}

void TestRejectPersistsOnlyAfterSave() {
  const auto dir = TestDir("reject_persist");
  BurstStore store(dir / "bursts.pb");
  store.Save(MakeCollection(3));

  auto updated = BurstStore::Reject(store.Load(), {0});
  assert(store.Load().bursts_size() == 3);

  store.Save(updated);
  assert(store.Load().bursts_size() == 2);
  assert(FirstId(store.Load(), 0) == "1-a");
}

} // namespace

int main() {
  TestSaveThenLoadRoundTrips();
  TestEmptyCollectionRoundTrips();
  TestLoadMissingArtifact();
  TestLoadCorruptArtifact();
  TestLoadRejectsSingleFrameBurst();
  TestInvalidate();
  TestRejectSingle();
  TestRejectBatchUsesSnapshotPositions();
  TestRejectOutOfRangeRemovesNothing();
  TestRejectEmptySetIsNoop();
  TestRejectPersistsOnlyAfterSave();

  std::cout << "pano_manager_unit_burst_store: pass\n";
  return 0;
}
