#include "burst_detector.hpp"

#include <algorithm>
#include <cstddef>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace pano::detect {

using namespace pano::manager::v1;
using pano::model::CaptureRecord;
using pano::observability::IntField;

namespace {

using Group = std::vector<const CaptureRecord*>;

std::vector<Group> PartitionBySettings(const std::vector<CaptureRecord>& records) {
  std::vector<Group> groups;
  std::vector<bool>  grouped(records.size(), false);

  for (std::size_t seed = 0; seed < records.size(); ++seed) {
    if (grouped[seed]) continue;

    Group group{&records[seed]};
    grouped[seed] = true;

    for (std::size_t candidate = seed + 1; candidate < records.size(); ++candidate) {
      if (!grouped[candidate] && records[candidate].settings == records[seed].settings) {
        group.push_back(&records[candidate]);
        grouped[candidate] = true;
      }
    }

    groups.push_back(std::move(group));
  }

  return groups;
}

void SplitByGap(std::vector<Group>& groups, std::chrono::seconds gap_threshold) {
  // tails appended below are already gap-free; only the classes are scanned
  const std::size_t classes = groups.size();

  for (std::size_t g = 0; g < classes; ++g) {
    std::stable_sort(groups[g].begin(), groups[g].end(),
                     [](const CaptureRecord* a, const CaptureRecord* b) { return *a->captured_at < *b->captured_at; });

    for (std::size_t i = groups[g].size(); i-- > 1;) {
      auto& group = groups[g];
      if (*group[i]->captured_at - *group[i - 1]->captured_at <= gap_threshold) {
        continue;
      }

      Group tail(group.begin() + static_cast<std::ptrdiff_t>(i), group.end());
      group.erase(group.begin() + static_cast<std::ptrdiff_t>(i), group.end());
      groups.push_back(std::move(tail));
    }
  }
}

Burst Materialize(const Group& group) {
  Burst burst;
  for (const auto* record : group) {
    auto* frame = burst.add_frames();
    frame->set_id(record->id);
    frame->set_path(record->path.string());
    *frame->mutable_captured_at() = pano::util::ToProto(*record->captured_at);
  }
  return burst;
}

} // namespace

BurstDetector::BurstDetector(DetectorOptions options) : options_(options) {
}

BurstCollection BurstDetector::Detect(const std::vector<CaptureRecord>& records) const {
  for (const auto& record : records) {
    if (!record.captured_at) {
      throw pano::util::MetadataUnavailable(record.id + ": no capture time, cannot order frames");
    }
  }

  auto       groups  = PartitionBySettings(records);
  const auto classes = groups.size();

  SplitByGap(groups, options_.gap_threshold);

  groups.erase(std::remove_if(groups.begin(), groups.end(), [](const Group& group) { return group.size() == 1; }), groups.end());

  BurstCollection collection;
  for (const auto& group : groups) {
    *collection.add_bursts() = Materialize(group);
  }

  PANO_LOG_INFO("Detected bursts", {IntField("records", static_cast<std::int64_t>(records.size())),
                                    IntField("settings_classes", static_cast<std::int64_t>(classes)),
                                    IntField("bursts", collection.bursts_size()),
                                    IntField("gap_threshold_s", options_.gap_threshold.count())});
  return collection;
}

} // namespace pano::detect
