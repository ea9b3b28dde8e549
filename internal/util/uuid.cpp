#include "uuid.hpp"

#include <random>

namespace pano::util {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

std::mt19937_64& Engine() {
  static thread_local std::mt19937_64 engine{std::random_device{}()};
  return engine;
}

} // namespace

UUID GenerateUUID() {
  UUID id{};

  // two 64-bit draws fill the 16 bytes
  for (std::size_t half = 0; half < 2; ++half) {
    auto bits = Engine()();
    for (std::size_t i = 0; i < 8; ++i, bits >>= 8) {
      id[half * 8 + i] = static_cast<std::uint8_t>(bits & 0xFF);
    }
  }

  id[6] = static_cast<std::uint8_t>((id[6] & 0x0F) | 0x40); // version 4
  id[8] = static_cast<std::uint8_t>((id[8] & 0x3F) | 0x80); // RFC4122 variant
  return id;
}

std::string ToString(const UUID& id) {
  std::string out;
  out.reserve(36);
  for (std::size_t i = 0; i < id.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
    out.push_back(kHexDigits[id[i] >> 4]);
    out.push_back(kHexDigits[id[i] & 0x0F]);
  }
  return out;
}

std::string WorkFolderName(std::string_view prefix) {
  return std::string(prefix) + "_" + ToString(GenerateUUID());
}

} // namespace pano::util
