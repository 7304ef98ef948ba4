#pragma once

// Generator deployment-mode vocabulary.
//
// C++ Core Guidelines Enum.2: use enumerations to represent sets of related named constants.
// Every enumerator has a canonical flag string; parse_* and to_string are exact inverses.
//
// CLI flags: --policy <sequence|dedup>, --bucket <tick|second>, --overflow <fail|wrap>

#include "horaid/id/reference_epoch.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace horaid::id {

// GeneratorPolicy selects the anti-collision strategy for identifiers issued
// within one time bucket.
enum class GeneratorPolicy : uint8_t {
  kSequence,  // "sequence": monotonic counter in bytes 6–7, strictly increasing ids
  kDedup,     // "dedup"   : random bytes 6–7, rejection against the bucket's issued set
};

// BucketResolution selects when per-bucket state (counter or issued set) resets.
enum class BucketResolution : uint8_t {
  kTick,    // "tick"  : one encoded time_low step (1/256 s)
  kSecond,  // "second": one time_high step
};

// SequenceOverflow decides what happens when 65535 identifiers have been issued
// in one bucket under GeneratorPolicy::kSequence.
//
// kWrap restarts the counter and WILL issue duplicates of ids already handed out
// in the same bucket. It exists only for deployments that prefer availability.
enum class SequenceOverflow : uint8_t {
  kFail,  // "fail": next() returns GenerateError::kSequenceExhausted until the bucket advances
  kWrap,  // "wrap": counter restarts at 1 within the same bucket
};

// kMaxSequence is the per-bucket capacity of the sequence policy.
constexpr std::uint16_t kMaxSequence = 0xFFFF;

// kDefaultMaxDedupAttempts bounds the dedup policy's rejection loop.
constexpr std::size_t kDefaultMaxDedupAttempts = 1000;

// GeneratorConfig holds every tunable of a generator. Every field has an
// explicit default; the default config is a production sequence generator.
struct GeneratorConfig {
  GeneratorPolicy policy{GeneratorPolicy::kSequence};     // NOLINT(readability-identifier-naming)
  BucketResolution bucket{BucketResolution::kTick};       // NOLINT(readability-identifier-naming)
  SequenceOverflow overflow{SequenceOverflow::kFail};     // NOLINT(readability-identifier-naming)
  std::size_t max_dedup_attempts{kDefaultMaxDedupAttempts};  // NOLINT(readability-identifier-naming)
  // Dedup policy only: draw byte 5 at random instead of using the machine id.
  bool random_machine_byte{false};  // NOLINT(readability-identifier-naming)
  // Dedup policy only: fixed PRNG seed for reproducible runs. Unset means std::random_device.
  std::optional<std::uint64_t> random_seed;                       // NOLINT(readability-identifier-naming)
  std::int64_t reference_epoch_millis{kReferenceEpochMillis};     // NOLINT(readability-identifier-naming)
};

[[nodiscard]] std::optional<GeneratorPolicy> parse_generator_policy(std::string_view s);
[[nodiscard]] std::optional<BucketResolution> parse_bucket_resolution(std::string_view s);
[[nodiscard]] std::optional<SequenceOverflow> parse_sequence_overflow(std::string_view s);

[[nodiscard]] std::string_view to_string(GeneratorPolicy p);
[[nodiscard]] std::string_view to_string(BucketResolution b);
[[nodiscard]] std::string_view to_string(SequenceOverflow o);

// parse_machine_id parses a decimal machine id in 0..255.
// Rejects: empty string, sign characters, non-digits, values above 255.
// Leading zeros are accepted ("007" == 7).
[[nodiscard]] std::optional<std::uint8_t> parse_machine_id(std::string_view s);

// validate_generator_config checks cross-field preconditions.
// Returns: "" on success, non-empty error message on failure.
[[nodiscard]] std::string validate_generator_config(const GeneratorConfig& config);

// generator_config_to_log_string returns a deterministic one-line summary for
// startup diagnostics, e.g. "policy=sequence bucket=tick overflow=fail".
[[nodiscard]] std::string generator_config_to_log_string(const GeneratorConfig& config);

}  // namespace horaid::id
