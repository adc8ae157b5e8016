#include "uuid.hpp"

#include <array>
#include <cstdint>
#include <random>

namespace sandbox::util {

namespace {

constexpr char kHex[] = "0123456789abcdef";

std::mt19937_64& Rng() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  return rng;
}

} // namespace

std::string NewId() {
  std::array<uint8_t, 16> bytes{};
  for (std::size_t i = 0; i < bytes.size(); i += 8) {
    const uint64_t word = Rng()();
    for (std::size_t j = 0; j < 8; ++j) {
      bytes[i + j] = static_cast<uint8_t>(word >> (j * 8));
    }
  }
  bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
  bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

  std::string out;
  out.reserve(36);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
    out.push_back(kHex[bytes[i] >> 4]);
    out.push_back(kHex[bytes[i] & 0x0F]);
  }
  return out;
}

std::string RandomSuffix(std::size_t chars) {
  std::string out;
  out.reserve(chars);
  while (out.size() < chars) {
    uint64_t word = Rng()();
    for (int nibble = 0; nibble < 16 && out.size() < chars; ++nibble, word >>= 4) {
      out.push_back(kHex[word & 0x0F]);
    }
  }
  return out;
}

} // namespace sandbox::util
