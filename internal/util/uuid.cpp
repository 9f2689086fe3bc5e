#include "uuid.hpp"

namespace stash::util {

namespace {

constexpr char kHexDigits[] = "0123456789ABCDEF";

constexpr bool IsGroupBoundary(std::size_t byte) {
  return byte == 4 || byte == 6 || byte == 8 || byte == 10;
}

} // namespace

UUID GenerateUUID() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  // two 64-bit draws fill the 16 bytes
  UUID id{};
  for (std::size_t half = 0; half < 2; ++half) {
    const auto bits = rng();
    for (std::size_t i = 0; i < 8; ++i) {
      id[half * 8 + i] = static_cast<std::uint8_t>(bits >> (i * 8));
    }
  }

  // RFC4122 variant + version 4
  id[6] = (id[6] & 0x0F) | 0x40;
  id[8] = (id[8] & 0x3F) | 0x80;

  return id;
}

std::string ToString(const UUID& id) {
  std::string out;
  out.reserve(36);
  for (std::size_t i = 0; i < id.size(); ++i) {
    if (IsGroupBoundary(i)) out.push_back('-');
    out.push_back(kHexDigits[id[i] >> 4]);
    out.push_back(kHexDigits[id[i] & 0x0F]);
  }
  return out;
}

std::string GenerateUUIDString() {
  return ToString(GenerateUUID());
}

} // namespace stash::util
