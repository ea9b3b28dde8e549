#pragma once

#include <filesystem>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "internal/model/capture_record.hpp"
#include "internal/runtime/tool_runner.hpp"

namespace pano::metadata {

/*
  Which metadata keys matter.

  Keys are compared after reducing the reader's hierarchical key
  (e.g. "Exif.Photo.FNumber") to its final component ("FNumber").
*/
struct MetadataSchema {
  std::string           group         = "Exif.Photo";
  std::string           timestamp_key = "DateTimeOriginal";
  std::set<std::string> settings_keys;

  static MetadataSchema Default();
};

// "Exif.Photo.FNumber" -> "FNumber"
std::string FinalKeyComponent(const std::string& key);

/*
  Parses newline-delimited "key value" output of the metadata reader.

  Throws util::MetadataUnavailable on an unparsable line, a missing or
  malformed timestamp, or when any of schema.settings_keys is absent.
  Never returns a partially populated record.
*/
pano::model::CaptureRecord ParseMetadataDump(const std::string& dump, const std::filesystem::path& source, const MetadataSchema& schema);

class MetadataExtractor {
 public:
  virtual ~MetadataExtractor() = default;

  virtual pano::model::CaptureRecord Extract(const std::filesystem::path& path) = 0;

  // Extracts every path in order; the first failure aborts the whole run.
  std::vector<pano::model::CaptureRecord> ExtractAll(const std::vector<std::filesystem::path>& paths);
};

using MetadataExtractorPtr = std::shared_ptr<MetadataExtractor>;

/*
  Runs `exiv2 -g <group> -Pkv <file>` once per file.
*/
class ExifToolExtractor final : public MetadataExtractor {
 public:
  ExifToolExtractor(pano::runtime::ToolRunnerPtr runner, std::string exiv2_binary, MetadataSchema schema = MetadataSchema::Default());

  pano::model::CaptureRecord Extract(const std::filesystem::path& path) override;

 private:
  pano::runtime::ToolRunnerPtr runner_;
  std::string                  exiv2_binary_;
  MetadataSchema               schema_;
};

} // namespace pano::metadata
