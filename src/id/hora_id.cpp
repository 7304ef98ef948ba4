#include "horaid/id/hora_id.h"

#include "horaid/core/time.h"
#include "horaid/id/rescale.h"

#include <optional>

namespace horaid::id {

namespace {

constexpr std::string_view kHexDigits = "0123456789abcdef";

// hex_value maps one hex character (either case) to its nibble value.
std::optional<std::uint8_t> hex_value(const char ch) {
  if (ch >= '0' && ch <= '9') {
    return static_cast<std::uint8_t>(ch - '0');
  }
  if (ch >= 'a' && ch <= 'f') {
    return static_cast<std::uint8_t>(ch - 'a' + 10);
  }
  if (ch >= 'A' && ch <= 'F') {
    return static_cast<std::uint8_t>(ch - 'A' + 10);
  }
  return std::nullopt;
}

}  // namespace

HoraId HoraId::encode(const std::uint64_t reference_millis, const std::uint8_t machine_id,
                      const std::uint16_t sequence) {
  const auto high = static_cast<std::uint32_t>(reference_millis / 1000U);
  const auto low = static_cast<std::uint16_t>(reference_millis % 1000U);

  Bytes bytes{};
  bytes[0] = static_cast<std::uint8_t>((high >> 24U) & 0xFFU);
  bytes[1] = static_cast<std::uint8_t>((high >> 16U) & 0xFFU);
  bytes[2] = static_cast<std::uint8_t>((high >> 8U) & 0xFFU);
  bytes[3] = static_cast<std::uint8_t>(high & 0xFFU);
  bytes[4] = rescale_low(low);
  bytes[5] = machine_id;
  bytes[6] = static_cast<std::uint8_t>((sequence >> 8U) & 0xFFU);
  bytes[7] = static_cast<std::uint8_t>(sequence & 0xFFU);
  return HoraId{bytes};
}

HoraId HoraId::from_u64(const std::uint64_t value) {
  Bytes bytes{};
  for (std::size_t i = 0; i < kSize; ++i) {
    const auto shift = static_cast<unsigned>((kSize - 1 - i) * 8);
    bytes[i] = static_cast<std::uint8_t>((value >> shift) & 0xFFU);
  }
  return HoraId{bytes};
}

core::Result<HoraId, core::FormatError> HoraId::from_hex(const std::string_view text) {
  using R = core::Result<HoraId, core::FormatError>;

  if (text.size() != kHexLength) {
    return R::err(core::FormatError::kWrongLength);
  }

  std::uint64_t value = 0;
  for (const char ch : text) {
    const auto nibble = hex_value(ch);
    if (!nibble.has_value()) {
      return R::err(core::FormatError::kInvalidHex);
    }
    value = (value << 4U) | nibble.value();
  }

  return R::ok(from_u64(value));
}

std::uint64_t HoraId::to_u64() const {
  std::uint64_t value = 0;
  for (const std::uint8_t b : bytes_) {
    value = (value << 8U) | b;
  }
  return value;
}

std::string HoraId::to_hex() const {
  std::string out;
  out.reserve(kHexLength);
  for (const std::uint8_t b : bytes_) {
    out.push_back(kHexDigits[(b >> 4U) & 0x0FU]);
    out.push_back(kHexDigits[b & 0x0FU]);
  }
  return out;
}

std::uint32_t HoraId::time_high() const {
  return (static_cast<std::uint32_t>(bytes_[0]) << 24U) |
         (static_cast<std::uint32_t>(bytes_[1]) << 16U) |
         (static_cast<std::uint32_t>(bytes_[2]) << 8U) | static_cast<std::uint32_t>(bytes_[3]);
}

std::uint16_t HoraId::sequence() const {
  return static_cast<std::uint16_t>((static_cast<std::uint16_t>(bytes_[6]) << 8U) | bytes_[7]);
}

std::int64_t HoraId::decode_unix_millis(const std::int64_t reference_epoch_millis) const {
  const auto whole_seconds = static_cast<std::int64_t>(time_high());
  const auto low = static_cast<std::int64_t>(upscale_low(time_low()));
  return (whole_seconds * 1000) + low + reference_epoch_millis;
}

std::string to_iso8601(const HoraId& id, const std::int64_t reference_epoch_millis) {
  return core::format_unix_millis_iso8601(id.decode_unix_millis(reference_epoch_millis));
}

}  // namespace horaid::id
