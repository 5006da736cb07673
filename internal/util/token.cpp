#include "token.hpp"

#include <cstdint>
#include <random>

namespace roadcast::util {

std::string RandomToken(std::size_t bytes) {
  static constexpr char kHex[] = "0123456789abcdef";
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  std::string out;
  out.reserve(bytes * 2);

  std::uint64_t word = 0;
  for (std::size_t i = 0; i < bytes; ++i) {
    if (i % 8 == 0) word = rng();
    const auto b = static_cast<std::uint8_t>(word >> ((i % 8) * 8));
    out.push_back(kHex[b >> 4]);
    out.push_back(kHex[b & 0x0F]);
  }
  return out;
}

} // namespace roadcast::util
