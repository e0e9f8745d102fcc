#include "core/uuid.hpp"

#include <array>
#include <cstdint>
#include <mutex>
#include <random>

namespace swarm {

namespace {

std::mt19937_64 &generator() {
  static std::mt19937_64 gen{std::random_device{}()};
  return gen;
}

std::mutex &generator_mutex() {
  static std::mutex mutex;
  return mutex;
}

}  // namespace

std::string generate_uuid() {
  std::array<uint8_t, 16> bytes{};
  {
    std::lock_guard lock(generator_mutex());
    std::uniform_int_distribution<int> dist(0, 255);
    for (auto &b : bytes) {
      b = static_cast<uint8_t>(dist(generator()));
    }
  }

  bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);  // version 4
  bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);  // RFC 4122 variant

  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(36);
  for (size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      out.push_back('-');
    }
    out.push_back(kHex[bytes[i] >> 4]);
    out.push_back(kHex[bytes[i] & 0x0F]);
  }
  return out;
}

}  // namespace swarm
