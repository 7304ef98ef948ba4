#include "horaid/id/hora_id.h"
#include "horaid/id/hora_id_json.h"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <limits>
#include <string>

using namespace horaid;
using id::HoraId;

// ── encode: byte layout ─────────────────────────────────────────────────────

TEST_CASE("encode places fields big-endian in the documented layout", "[encoder]") {
  // 1234 ms after the reference epoch, machine 7, sequence 1
  const HoraId hid = HoraId::encode(1234, 7, 1);
  const HoraId::Bytes expected{0, 0, 0, 1, 59, 7, 0, 1};

  CHECK(hid.bytes() == expected);
  CHECK(hid.to_hex() == "000000013b070001");
  CHECK(hid.to_u64() == 5285281793ULL);
  CHECK(hid.time_high() == 1);
  CHECK(hid.time_low() == 59);
  CHECK(hid.machine_id() == 7);
  CHECK(hid.sequence() == 1);
}

TEST_CASE("encode splits multi-byte seconds and sequence across bytes", "[encoder]") {
  // 0x01020304 seconds + 999 ms, machine 0xAB, sequence 0xBEEF
  const std::uint64_t millis = (0x01020304ULL * 1000) + 999;
  const HoraId hid = HoraId::encode(millis, 0xAB, 0xBEEF);

  const HoraId::Bytes expected{0x01, 0x02, 0x03, 0x04, 0xFF, 0xAB, 0xBE, 0xEF};
  CHECK(hid.bytes() == expected);
  CHECK(hid.time_high() == 0x01020304U);
  CHECK(hid.sequence() == 0xBEEF);
}

TEST_CASE("default HoraId is all zero", "[encoder]") {
  const HoraId hid;
  CHECK(hid.to_u64() == 0);
  CHECK(hid.to_hex() == "0000000000000000");
}

// ── decode ──────────────────────────────────────────────────────────────────

TEST_CASE("decode_unix_millis reconstructs the instant within 4 ms", "[encoder][decode]") {
  constexpr std::int64_t kEpoch = 1700000000000;

  SECTION("worked example") {
    const HoraId hid = HoraId::encode(1234, 7, 1);
    CHECK(hid.decode_unix_millis(kEpoch) == 1700000001230);
  }

  SECTION("every millisecond of several seconds") {
    for (std::uint64_t m = 0; m < 5000; ++m) {
      const HoraId hid = HoraId::encode(m, 0, 0);
      const std::int64_t decoded = hid.decode_unix_millis(kEpoch);
      const auto original = static_cast<std::int64_t>(m) + kEpoch;
      REQUIRE(decoded <= original);
      REQUIRE(original - decoded <= 4);
      // Pure: decoding the same identifier again yields the same instant.
      REQUIRE(hid.decode_unix_millis(kEpoch) == decoded);
    }
  }
}

TEST_CASE("decode defaults to the published reference epoch", "[encoder][decode]") {
  const HoraId hid = HoraId::encode(0, 0, 0);
  CHECK(hid.decode_unix_millis() == id::kReferenceEpochMillis);
  CHECK(id::to_iso8601(hid) == "2025-01-01T00:00:00.000Z");
  CHECK(id::to_iso8601(HoraId::encode(500, 0, 0)) == "2025-01-01T00:00:00.500Z");
}

// ── hex ─────────────────────────────────────────────────────────────────────

TEST_CASE("to_hex is 16 lower-case hex characters and parses back exactly", "[encoder][hex]") {
  for (int b = 0; b < 256; ++b) {
    const auto byte = static_cast<std::uint8_t>(b);
    const HoraId hid{HoraId::Bytes{byte, byte, byte, byte, byte, byte, byte, byte}};
    const std::string hex = hid.to_hex();

    REQUIRE(hex.size() == 16);
    for (const char c : hex) {
      REQUIRE(((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')));
    }

    const auto parsed = HoraId::from_hex(hex);
    REQUIRE(parsed.has_value());
    REQUIRE(parsed.value() == hid);
  }
}

TEST_CASE("from_hex accepts upper-case digits", "[encoder][hex]") {
  const auto parsed = HoraId::from_hex("000000013B070001");
  REQUIRE(parsed.has_value());
  CHECK(parsed.value().to_u64() == 5285281793ULL);
}

TEST_CASE("from_hex rejects malformed input with FormatError", "[encoder][hex]") {
  SECTION("empty string") {
    const auto r = HoraId::from_hex("");
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error() == core::FormatError::kWrongLength);
  }

  SECTION("15 and 17 characters") {
    CHECK(HoraId::from_hex("000000013b07000").error() == core::FormatError::kWrongLength);
    CHECK(HoraId::from_hex("000000013b0700011").error() == core::FormatError::kWrongLength);
  }

  SECTION("16 non-hex characters") {
    const auto r = HoraId::from_hex("zzzzzzzzzzzzzzzz");
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error() == core::FormatError::kInvalidHex);
  }

  SECTION("sign, prefix and whitespace are not hex") {
    CHECK(HoraId::from_hex("+00000013b070001").error() == core::FormatError::kInvalidHex);
    CHECK(HoraId::from_hex("0x000013b0700011").error() == core::FormatError::kInvalidHex);
    CHECK(HoraId::from_hex(" 00000013b070001").error() == core::FormatError::kInvalidHex);
  }

  SECTION("reason strings") {
    CHECK(core::to_string(core::FormatError::kWrongLength) == "wrong length");
    CHECK(core::to_string(core::FormatError::kInvalidHex) == "invalid hex");
  }
}

// ── integer ─────────────────────────────────────────────────────────────────

TEST_CASE("from_u64 and to_u64 are exact inverses", "[encoder][u64]") {
  const std::uint64_t samples[] = {  // NOLINT(modernize-avoid-c-arrays)
      0ULL,
      1ULL,
      255ULL,
      256ULL,
      5285281793ULL,
      57630818184577258ULL,
      0x0123456789ABCDEFULL,
      std::numeric_limits<std::uint64_t>::max() - 1,
      std::numeric_limits<std::uint64_t>::max(),
  };
  for (const std::uint64_t n : samples) {
    CHECK(HoraId::from_u64(n).to_u64() == n);
  }
  CHECK(HoraId::from_u64(0x0123456789ABCDEFULL).to_hex() == "0123456789abcdef");
}

// ── ordering ────────────────────────────────────────────────────────────────

TEST_CASE("HoraId ordering matches integer and hex ordering", "[encoder][ordering]") {
  // The time prefix dominates: a later tick sorts after any machine/sequence of an earlier one.
  const HoraId earlier = HoraId::encode(1234, 255, 65535);
  const HoraId later_tick = HoraId::encode(1238, 0, 1);

  CHECK(earlier < later_tick);
  CHECK(earlier.to_u64() < later_tick.to_u64());
  CHECK(earlier.to_hex() < later_tick.to_hex());

  CHECK(HoraId::encode(1234, 7, 2) > HoraId::encode(1234, 7, 1));
  CHECK(HoraId::encode(1234, 7, 1) == HoraId::from_u64(5285281793ULL));
}

// ── json ────────────────────────────────────────────────────────────────────

TEST_CASE("hora_id_to_json exposes every view", "[encoder][json]") {
  const auto j = id::hora_id_to_json(HoraId::encode(1234, 7, 1), 1700000000000);

  CHECK(j.at("hex") == "000000013b070001");
  CHECK(j.at("u64") == 5285281793ULL);
  CHECK(j.at("time_high") == 1);
  CHECK(j.at("time_low") == 59);
  CHECK(j.at("machine_id") == 7);
  CHECK(j.at("sequence") == 1);
  CHECK(j.at("unix_millis") == 1700000001230);
  CHECK(j.at("iso8601") == "2023-11-14T22:13:21.230Z");
}
