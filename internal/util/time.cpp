#include "time.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace pano::util {
namespace {

constexpr const char* kExifDateTimeShape  = "dddd:dd:dd dd:dd:dd";
constexpr std::size_t kExifDateTimeLength = 19;

} // namespace

std::optional<TimePoint> ParseExifDateTime(std::string_view value) {
  // trailing whitespace is allowed, anything else must match "YYYY:MM:DD HH:MM:SS" exactly
  const auto end = value.find_last_not_of(" \t\r\n");
  value          = end == std::string_view::npos ? std::string_view() : value.substr(0, end + 1);
  if (value.size() != kExifDateTimeLength) {
    return std::nullopt;
  }
  for (std::size_t i = 0; i < value.size(); ++i) {
    const char expected = kExifDateTimeShape[i];
    if (expected == 'd' ? !std::isdigit(static_cast<unsigned char>(value[i])) : value[i] != expected) {
      return std::nullopt;
    }
  }

  std::tm            tm{};
  std::istringstream in{std::string(value)};
  in >> std::get_time(&tm, "%Y:%m:%d %H:%M:%S");
  if (in.fail()) {
    return std::nullopt;
  }

  // EXIF times carry no zone; treating them as UTC keeps differences exact.
  std::tm           normalized = tm;
  const std::time_t seconds    = timegm(&normalized);
  std::tm           roundtrip{};
  if (!gmtime_r(&seconds, &roundtrip)) {
    return std::nullopt;
  }

  // timegm rolls out-of-range fields forward (Feb 30 -> Mar 2)
  if (roundtrip.tm_year != tm.tm_year || roundtrip.tm_mon != tm.tm_mon || roundtrip.tm_mday != tm.tm_mday ||
      roundtrip.tm_hour != tm.tm_hour || roundtrip.tm_min != tm.tm_min || roundtrip.tm_sec != tm.tm_sec) {
    return std::nullopt;
  }

  return TimePoint{std::chrono::seconds(seconds)};
}

std::string FormatExifDateTime(TimePoint tp) {
  const std::time_t seconds = tp.time_since_epoch().count();
  std::tm           tm{};
  gmtime_r(&seconds, &tm);

  std::ostringstream out;
  out << std::put_time(&tm, "%Y:%m:%d %H:%M:%S");
  return out.str();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  google::protobuf::Timestamp ts;
  ts.set_seconds(tp.time_since_epoch().count());
  ts.set_nanos(0);
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{std::chrono::seconds(ts.seconds())};
}

std::chrono::seconds Elapsed(const google::protobuf::Timestamp& from, const google::protobuf::Timestamp& to) {
  return FromProto(to) - FromProto(from);
}

} // namespace pano::util
