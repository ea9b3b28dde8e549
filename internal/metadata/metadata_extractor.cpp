#include "metadata_extractor.hpp"

#include <sstream>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace pano::metadata {

using pano::model::CaptureRecord;
using pano::observability::IntField;
using pano::observability::PathField;
using pano::observability::StringField;

namespace {

constexpr const char* kWhitespace = " \t\r\n";

std::string Trim(const std::string& s) {
  const auto begin = s.find_first_not_of(kWhitespace);
  if (begin == std::string::npos) return {};
  const auto end = s.find_last_not_of(kWhitespace);
  return s.substr(begin, end - begin + 1);
}

[[noreturn]] void Unavailable(const std::filesystem::path& source, const std::string& reason) {
  throw pano::util::MetadataUnavailable(source.string() + ": " + reason);
}

} // namespace

MetadataSchema MetadataSchema::Default() {
  MetadataSchema schema;
  schema.settings_keys = {
      "Contrast",        "ExposureBiasValue", "ExposureMode",     "ExposureProgram",  "ExposureTime",
      "FNumber",         "Flash",             "FocalLength",      "GainControl",      "ISOSpeedRatings",
      "LightSource",     "MaxApertureValue",  "MeteringMode",     "RecommendedExposureIndex",
      "Saturation",      "SceneCaptureType",  "SensingMethod",    "SensitivityType",  "Sharpness",
      "WhiteBalance",
  };
  return schema;
}

std::string FinalKeyComponent(const std::string& key) {
  const auto dot = key.rfind('.');
  return dot == std::string::npos ? key : key.substr(dot + 1);
}

CaptureRecord ParseMetadataDump(const std::string& dump, const std::filesystem::path& source, const MetadataSchema& schema) {
  CaptureRecord record;
  record.id   = source.stem().string();
  record.path = source;

  std::istringstream in(dump);
  std::string        line;
  std::size_t        line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    const auto trimmed = Trim(line);
    if (trimmed.empty()) {
      continue;
    }

    const auto split = trimmed.find_first_of(kWhitespace);
    const auto key   = trimmed.substr(0, split);
    const auto value = split == std::string::npos ? std::string() : Trim(trimmed.substr(split));

    // the reader always prints Family.Group.Tag keys
    if (key.find('.') == std::string::npos || key.back() == '.') {
      Unavailable(source, "unparsable metadata line " + std::to_string(line_no) + ": '" + trimmed + "'");
    }

    const auto name = FinalKeyComponent(key);
    if (name == schema.timestamp_key) {
      record.captured_at = pano::util::ParseExifDateTime(value);
      if (!record.captured_at) {
        Unavailable(source, "malformed " + schema.timestamp_key + " '" + value + "'");
      }
    } else if (schema.settings_keys.count(name)) {
      record.settings[name] = value;
    }
  }

  if (!record.captured_at) {
    Unavailable(source, "missing " + schema.timestamp_key);
  }

  if (record.settings.size() != schema.settings_keys.size()) {
    std::string missing;
    for (const auto& key : schema.settings_keys) {
      if (record.settings.count(key)) continue;
      if (!missing.empty()) missing += ", ";
      missing += key;
    }
    Unavailable(source, "missing settings attributes: " + missing);
  }

  return record;
}

std::vector<CaptureRecord> MetadataExtractor::ExtractAll(const std::vector<std::filesystem::path>& paths) {
  std::vector<CaptureRecord> records;
  records.reserve(paths.size());
  for (const auto& path : paths) {
    records.push_back(Extract(path));
  }
  return records;
}

ExifToolExtractor::ExifToolExtractor(pano::runtime::ToolRunnerPtr runner, std::string exiv2_binary, MetadataSchema schema)
    : runner_(std::move(runner)), exiv2_binary_(std::move(exiv2_binary)), schema_(std::move(schema)) {
}

CaptureRecord ExifToolExtractor::Extract(const std::filesystem::path& path) {
  PANO_LOG_DEBUG("Reading metadata", {PathField("path", path)});

  const std::vector<std::string> argv = {exiv2_binary_, "-g", schema_.group, "-Pkv", path.string()};
  pano::runtime::CommandResult   result;
  try {
    result = runner_->Run(argv);
  } catch (const pano::util::ExternalToolFailure& e) {
    Unavailable(path, e.what());
  }
  if (!result) {
    PANO_LOG_ERROR("Metadata reader failed", {PathField("path", path), IntField("exit_code", result.exit_code)});
    Unavailable(path, exiv2_binary_ + " exited with code " + std::to_string(result.exit_code));
  }

  auto record = ParseMetadataDump(result.output, path, schema_);
  PANO_LOG_DEBUG("Parsed metadata",
                 {StringField("id", record.id), IntField("settings", static_cast<std::int64_t>(record.settings.size())),
                  StringField("captured_at", pano::util::FormatExifDateTime(*record.captured_at))});
  return record;
}

} // namespace pano::metadata
