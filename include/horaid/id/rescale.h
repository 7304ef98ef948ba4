#pragma once

#include <cstdint>

namespace horaid::id {

// Sub-second precision is carried in a single byte: 0–999 ms maps onto 0–255.
// All conversions use integer floor division so results are exact and
// platform-independent.

// rescale_low maps milliseconds-within-second (0–999) to a byte: floor(v * 256 / 1000).
// Lossy and monotonic non-decreasing; several millisecond values share a byte.
// Inputs above 999 are reduced modulo 1000.
[[nodiscard]] constexpr std::uint8_t rescale_low(std::uint16_t millis) {
  const std::uint32_t in_range = static_cast<std::uint32_t>(millis) % 1000U;
  return static_cast<std::uint8_t>((in_range * 256U) / 1000U);
}

// upscale_low is the approximate inverse of rescale_low: floor(v * 1000 / 256).
// upscale_low(rescale_low(x)) never exceeds x and is at most 4 ms below it.
[[nodiscard]] constexpr std::uint16_t upscale_low(std::uint8_t scaled) {
  return static_cast<std::uint16_t>((static_cast<std::uint32_t>(scaled) * 1000U) / 256U);
}

// rescale_millis keeps whole seconds and replaces the millisecond remainder by
// its scaled byte value: (m / 1000) * 1000 + rescale_low(m % 1000).
// Two instants share a result exactly when they encode to the same time prefix,
// which makes this the tick-resolution time bucket.
[[nodiscard]] constexpr std::uint64_t rescale_millis(std::uint64_t millis) {
  const std::uint64_t high = millis / 1000U;
  const auto low = static_cast<std::uint16_t>(millis % 1000U);
  return (high * 1000U) + rescale_low(low);
}

}  // namespace horaid::id
