#pragma once

#include "horaid/core/result.h"
#include "horaid/id/reference_epoch.h"

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace horaid::id {

// HoraId is a time-sorted 8-byte identifier.
//
// Byte layout (big-endian throughout):
//   [0..3]  time_high   whole seconds since kReferenceEpochMillis (u32)
//   [4]     time_low    milliseconds-within-second scaled to 0–255
//   [5]     machine_id  machine/shard id or a random byte
//   [6..7]  sequence    per-bucket counter or two random bytes (u16)
//
// The value is regular and totally ordered: comparing two HoraIds compares
// their bytes lexicographically, which equals comparing to_u64() and to_hex().
class HoraId {
 public:
  static constexpr std::size_t kSize = 8;
  static constexpr std::size_t kHexLength = kSize * 2;

  using Bytes = std::array<std::uint8_t, kSize>;

  // All-zero identifier.
  HoraId() = default;
  explicit HoraId(const Bytes& bytes) : bytes_(bytes) {}

  // encode packs milliseconds elapsed since the reference epoch together with
  // the two disambiguator fields. Seconds beyond the u32 range are truncated.
  [[nodiscard]] static HoraId encode(std::uint64_t reference_millis, std::uint8_t machine_id,
                                     std::uint16_t sequence);

  [[nodiscard]] static HoraId from_u64(std::uint64_t value);

  // from_hex parses exactly 16 hexadecimal characters (either case).
  // kWrongLength for any other length, kInvalidHex for any non-hex character.
  [[nodiscard]] static core::Result<HoraId, core::FormatError> from_hex(std::string_view text);

  [[nodiscard]] std::uint64_t to_u64() const;

  // to_hex renders 16 lower-case hex characters, byte 0 first.
  [[nodiscard]] std::string to_hex() const;

  [[nodiscard]] const Bytes& bytes() const { return bytes_; }

  [[nodiscard]] std::uint32_t time_high() const;
  [[nodiscard]] std::uint8_t time_low() const { return bytes_[4]; }
  [[nodiscard]] std::uint8_t machine_id() const { return bytes_[5]; }
  [[nodiscard]] std::uint16_t sequence() const;

  // decode_unix_millis reconstructs the embedded instant as milliseconds since
  // the Unix epoch. Lossy: up to 4 ms below the instant that was encoded.
  [[nodiscard]] std::int64_t decode_unix_millis(
      std::int64_t reference_epoch_millis = kReferenceEpochMillis) const;

  auto operator<=>(const HoraId&) const = default;

 private:
  Bytes bytes_{};
};

// to_iso8601 renders the embedded instant as a UTC calendar datetime,
// e.g. "2025-03-20T00:00:00.000Z".
[[nodiscard]] std::string to_iso8601(const HoraId& id,
                                     std::int64_t reference_epoch_millis = kReferenceEpochMillis);

}  // namespace horaid::id
