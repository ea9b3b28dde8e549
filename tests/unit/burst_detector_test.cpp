#include <cassert>
#include <chrono>
#include <algorithm>
#include <iostream>
#include <map>
#include <string>
#include <vector>

#include "internal/detect/burst_detector.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using pano::detect::BurstDetector;
using pano::detect::DetectorOptions;
using pano::manager::v1::Burst;
using pano::model::CaptureRecord;
using pano::model::Settings;

const pano::util::TimePoint kT = *pano::util::ParseExifDateTime("2023:06:01 12:00:00");

Settings Iso(const std::string& iso) {
  return {{"ExposureTime", "1/250"}, {"FNumber", "8"}, {"ISOSpeedRatings", iso}};
}

CaptureRecord Record(const std::string& id, int offset_s, Settings settings = Iso("100")) {
  CaptureRecord record;
  record.id          = id;
  record.path        = "/photos/" + id + ".nef";
  record.settings    = std::move(settings);
  record.captured_at = kT + std::chrono::seconds(offset_s);
  return record;
}

std::vector<std::string> Ids(const Burst& burst) {
  std::vector<std::string> ids;
  for (const auto& frame : burst.frames()) {
    ids.push_back(frame.id());
  }
  return ids;
}

void TestSingleBurst() {
  const std::vector<CaptureRecord> records = {
      Record("a", 0), Record("b", 1), Record("c", 3), Record("d", 4), Record("e", 6), Record("f", 11),
  };

  auto collection = BurstDetector().Detect(records);

  // f is 5s after e and ends up alone
  assert(collection.bursts_size() == 1);
  assert((Ids(collection.bursts(0)) == std::vector<std::string>{"a", "b", "c", "d", "e"}));
}

void TestSettingsSeparateBursts() {
  const std::vector<CaptureRecord> records = {
      Record("a", 0), Record("b", 1, Iso("200")), Record("c", 2), Record("d", 3, Iso("200")),
  };

  auto collection = BurstDetector().Detect(records);

  assert(collection.bursts_size() == 2);
  assert((Ids(collection.bursts(0)) == std::vector<std::string>{"a", "c"}));
  assert((Ids(collection.bursts(1)) == std::vector<std::string>{"b", "d"}));
}

void TestGapAtThresholdStaysTogether() {
  auto collection = BurstDetector().Detect({Record("a", 0), Record("b", 4)});
  assert(collection.bursts_size() == 1);

  collection = BurstDetector().Detect({Record("a", 0), Record("b", 5)});
  assert(collection.bursts_size() == 0);
}

void TestConfigurableThreshold() {
  DetectorOptions options;
  options.gap_threshold = std::chrono::seconds(10);

  auto collection = BurstDetector(options).Detect({Record("a", 0), Record("b", 9), Record("c", 30)});
  assert(collection.bursts_size() == 1);
  assert((Ids(collection.bursts(0)) == std::vector<std::string>{"a", "b"}));
}

void TestFramesSortedByCaptureTime() {
  auto collection = BurstDetector().Detect({Record("c", 2), Record("a", 0), Record("b", 1)});

  assert(collection.bursts_size() == 1);
  assert((Ids(collection.bursts(0)) == std::vector<std::string>{"a", "b", "c"}));
}

void TestSplitTailsFollowClasses() {
  // class ISO100: {a,b} gap {c,d}; class ISO200: {x,y}
  const std::vector<CaptureRecord> records = {
      Record("a", 0), Record("b", 1), Record("c", 20), Record("d", 21), Record("x", 2, Iso("200")), Record("y", 3, Iso("200")),
  };

  auto collection = BurstDetector().Detect(records);

  assert(collection.bursts_size() == 3);
  assert((Ids(collection.bursts(0)) == std::vector<std::string>{"a", "b"}));
  assert((Ids(collection.bursts(1)) == std::vector<std::string>{"x", "y"}));
  assert((Ids(collection.bursts(2)) == std::vector<std::string>{"c", "d"}));
}

void TestMultipleSplitsAppendLatestFirst() {
  const std::vector<CaptureRecord> records = {
      Record("a", 0), Record("b", 1), Record("c", 20), Record("d", 21), Record("e", 40), Record("f", 41),
  };

  auto collection = BurstDetector().Detect(records);

  // the backward scan cuts the latest tail first
  assert(collection.bursts_size() == 3);
  assert((Ids(collection.bursts(0)) == std::vector<std::string>{"a", "b"}));
  assert((Ids(collection.bursts(1)) == std::vector<std::string>{"e", "f"}));
  assert((Ids(collection.bursts(2)) == std::vector<std::string>{"c", "d"}));
}

void TestEmptyInput() {
  auto collection = BurstDetector().Detect({});
  assert(collection.bursts_size() == 0);
}

void TestBurstInvariants() {
  const std::vector<CaptureRecord> records = {
      Record("a", 0),  Record("b", 2),  Record("c", 4, Iso("400")), Record("d", 5, Iso("400")), Record("e", 7),
      Record("f", 30), Record("g", 33), Record("h", 34, Iso("400")), Record("i", 60),
  };
  const DetectorOptions options;

  auto collection = BurstDetector(options).Detect(records);

  for (const auto& burst : collection.bursts()) {
    assert(burst.frames_size() >= 2);
    for (int i = 1; i < burst.frames_size(); ++i) {
      const auto gap = pano::util::Elapsed(burst.frames(i - 1).captured_at(), burst.frames(i).captured_at());
      assert(gap >= std::chrono::seconds(0));
      assert(gap <= options.gap_threshold);
    }
  }
}

void TestGapSplitsOneClassInTwo() {
  const std::vector<CaptureRecord> records = {
      Record("a", 0), Record("b", 1), Record("c", 2), Record("d", 10), Record("e", 11),
  };

  auto collection = BurstDetector().Detect(records);

  assert(collection.bursts_size() == 2);
  assert((Ids(collection.bursts(0)) == std::vector<std::string>{"a", "b", "c"}));
  assert((Ids(collection.bursts(1)) == std::vector<std::string>{"d", "e"}));
}

void TestSettingsEqualWithinAndDifferAcrossBursts() {
  const std::vector<CaptureRecord> records = {
      Record("a", 0),  Record("b", 1, Iso("200")), Record("c", 2),  Record("d", 3, Iso("200")), Record("e", 4, Iso("400")),
      Record("f", 5, Iso("400")), Record("g", 30), Record("h", 31), Record("i", 32, Iso("800")),
  };
  std::map<std::string, const CaptureRecord*> by_id;
  for (const auto& record : records) {
    by_id[record.id] = &record;
  }
  const DetectorOptions options;

  auto collection = BurstDetector(options).Detect(records);
  assert(collection.bursts_size() == 4);

  for (int i = 0; i < collection.bursts_size(); ++i) {
    const auto& burst    = collection.bursts(i);
    const auto& settings = by_id.at(burst.frames(0).id())->settings;
    for (const auto& frame : burst.frames()) {
      assert(by_id.at(frame.id())->settings == settings);
    }

    // equal settings across bursts only for tails split off one class
    for (int j = i + 1; j < collection.bursts_size(); ++j) {
      const auto& other = collection.bursts(j);
      if (by_id.at(other.frames(0).id())->settings != settings) continue;

      const auto& first_end   = burst.frames(burst.frames_size() - 1).captured_at();
      const auto& other_start = other.frames(0).captured_at();
      const auto& other_end   = other.frames(other.frames_size() - 1).captured_at();
      const auto& first_start = burst.frames(0).captured_at();
      const auto  gap         = std::max(pano::util::Elapsed(first_end, other_start), pano::util::Elapsed(other_end, first_start));
      assert(gap > options.gap_threshold);
    }
  }
}

void TestMissingCaptureTimeFails() {
  std::vector<CaptureRecord> records = {Record("a", 0), Record("b", 1)};
  records.back().captured_at         = std::nullopt;

  bool threw = false;
  try {
    (void)BurstDetector().Detect(records);
  } catch (const pano::util::MetadataUnavailable&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestSingleBurst();
  TestSettingsSeparateBursts();
  TestGapAtThresholdStaysTogether();
  TestConfigurableThreshold();
  TestFramesSortedByCaptureTime();
  TestSplitTailsFollowClasses();
  TestMultipleSplitsAppendLatestFirst();
  TestEmptyInput();
  TestBurstInvariants();
  TestGapSplitsOneClassInTwo();
  TestSettingsEqualWithinAndDifferAcrossBursts();
  TestMissingCaptureTimeFails();

  std::cout << "pano_manager_unit_burst_detector: pass\n";
  return 0;
}
