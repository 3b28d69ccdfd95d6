#include "run_token.hpp"

#include <random>

namespace fleetq::util {

std::string NewRunToken(std::size_t bytes) {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  static constexpr char              kHex[] = "0123456789abcdef";

  std::uniform_int_distribution<int> byte(0, 255);

  std::string out;
  out.reserve(bytes * 2);
  for (std::size_t i = 0; i < bytes; ++i) {
    const int b = byte(rng);
    out.push_back(kHex[b >> 4]);
    out.push_back(kHex[b & 0x0F]);
  }
  return out;
}

} // namespace fleetq::util
