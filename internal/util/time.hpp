#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include "google/protobuf/timestamp.pb.h"

namespace pano::util {

/*
  Time utilities. Capture times are whole seconds.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = std::chrono::time_point<Clock, std::chrono::seconds>;

// Parses EXIF "YYYY:MM:DD HH:MM:SS". Returns nullopt on truncated input or
// on a field outside its calendar range (month 13, Feb 30, hour 24).
std::optional<TimePoint> ParseExifDateTime(std::string_view value);
std::string              FormatExifDateTime(TimePoint tp);

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

std::chrono::seconds Elapsed(const google::protobuf::Timestamp& from, const google::protobuf::Timestamp& to);

} // namespace pano::util
