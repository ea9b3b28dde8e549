#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>

#include "internal/stitch/projections.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace pano::config {

using pano::runtime::config::RuntimeConfig;

namespace {

google::protobuf::Value ScalarToValue(const YAML::Node& node) {
  google::protobuf::Value value;
  const auto&             scalar = node.Scalar();

  // quoted scalars stay strings ("2" as a projection id, "" as a style)
  if (node.Tag() == "!") {
    value.set_string_value(scalar);
    return value;
  }

  if (scalar == "true" || scalar == "false") {
    value.set_bool_value(scalar == "true");
    return value;
  }

  char*        end    = nullptr;
  const double number = std::strtod(scalar.c_str(), &end);
  if (!scalar.empty() && end && *end == '\0') {
    value.set_number_value(number);
    return value;
  }

  value.set_string_value(scalar);
  return value;
}

google::protobuf::Value YamlToValue(const YAML::Node& node) {
  google::protobuf::Value value;

  switch (node.Type()) {
    case YAML::NodeType::Null:
      value.set_null_value(google::protobuf::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      value = ScalarToValue(node);
      break;

    case YAML::NodeType::Sequence: {
      auto* list = value.mutable_list_value();
      for (const auto& item : node) {
        *list->add_values() = YamlToValue(item);
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto& fields = *value.mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) {
        fields[entry.first.Scalar()] = YamlToValue(entry.second);
      }
      break;
    }

    default:
      throw pano::util::InvalidArgument("unsupported YAML node");
  }

  return value;
}

RuntimeConfig ParseDocument(const YAML::Node& document, const std::string& source) {
  RuntimeConfig config;

  // an empty document is a valid, all-defaults config
  if (document.IsNull()) {
    return config;
  }
  if (!document.IsMap()) {
    throw pano::util::InvalidArgument(source + ": top level must be a mapping");
  }

  std::string json;
  auto        to_json = google::protobuf::util::MessageToJsonString(YamlToValue(document), &json);
  if (!to_json.ok()) {
    throw pano::util::InvalidArgument(source + ": cannot convert YAML to JSON: " + std::string(to_json.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto parsed = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!parsed.ok()) {
    throw pano::util::InvalidArgument(source + ": invalid configuration: " + std::string(parsed.message()));
  }

  ConfigLoader::Validate(config);
  return config;
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node document;
  try {
    document = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw pano::util::InvalidArgument("failed to load YAML config " + path + ": " + e.what());
  }
  return ParseDocument(document, path);
}

RuntimeConfig ConfigLoader::LoadFromString(const std::string& yaml) {
  YAML::Node document;
  try {
    document = YAML::Load(yaml);
  } catch (const YAML::Exception& e) {
    throw pano::util::InvalidArgument("failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseDocument(document, "<string>");
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  for (const auto& ext : config.detection().raw_extensions()) {
    if (ext.empty() || ext == ".") {
      throw pano::util::InvalidArgument("detection.raw_extensions: empty extension");
    }
  }

  if (!config.workspace().artifact_name().empty()) {
    pano::storage::common::ValidateArtifactName(config.workspace().artifact_name());
  }

  for (const auto& projection : config.stitch().projections()) {
    (void)pano::stitch::ProjectionIndex(projection);
  }

  const auto& format = config.stitch().intermediate_format();
  if (!format.empty() && (format.size() < 2 || format.front() != '.')) {
    throw pano::util::InvalidArgument("stitch.intermediate_format must be an extension such as .tif, got '" + format + "'");
  }
}

} // namespace pano::config
