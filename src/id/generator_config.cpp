#include "horaid/id/generator_config.h"

namespace horaid::id {

std::optional<GeneratorPolicy> parse_generator_policy(const std::string_view s) {
  if (s == "sequence") {
    return GeneratorPolicy::kSequence;
  }
  if (s == "dedup") {
    return GeneratorPolicy::kDedup;
  }
  return std::nullopt;
}

std::optional<BucketResolution> parse_bucket_resolution(const std::string_view s) {
  if (s == "tick") {
    return BucketResolution::kTick;
  }
  if (s == "second") {
    return BucketResolution::kSecond;
  }
  return std::nullopt;
}

std::optional<SequenceOverflow> parse_sequence_overflow(const std::string_view s) {
  if (s == "fail") {
    return SequenceOverflow::kFail;
  }
  if (s == "wrap") {
    return SequenceOverflow::kWrap;
  }
  return std::nullopt;
}

std::string_view to_string(const GeneratorPolicy p) {
  switch (p) {
    case GeneratorPolicy::kSequence:
      return "sequence";
    case GeneratorPolicy::kDedup:
      return "dedup";
  }
  return "unknown";  // unreachable: all enumerators covered above
}

std::string_view to_string(const BucketResolution b) {
  switch (b) {
    case BucketResolution::kTick:
      return "tick";
    case BucketResolution::kSecond:
      return "second";
  }
  return "unknown";  // unreachable: all enumerators covered above
}

std::string_view to_string(const SequenceOverflow o) {
  switch (o) {
    case SequenceOverflow::kFail:
      return "fail";
    case SequenceOverflow::kWrap:
      return "wrap";
  }
  return "unknown";  // unreachable: all enumerators covered above
}

std::optional<std::uint8_t> parse_machine_id(const std::string_view s) {
  if (s.empty()) {
    return std::nullopt;
  }

  // Validate and accumulate in one pass; bail out as soon as the value leaves range.
  unsigned value = 0;
  for (const char c : s) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    value = (value * 10U) + static_cast<unsigned>(c - '0');
    if (value > 255U) {
      return std::nullopt;
    }
  }

  return static_cast<std::uint8_t>(value);
}

std::string validate_generator_config(const GeneratorConfig& config) {
  if (config.reference_epoch_millis < 0) {
    return "Invalid generator config: reference epoch must not precede the Unix epoch";
  }
  if (config.policy == GeneratorPolicy::kDedup && config.max_dedup_attempts == 0) {
    return "Invalid generator config: dedup policy requires max_dedup_attempts >= 1";
  }
  return "";
}

std::string generator_config_to_log_string(const GeneratorConfig& config) {
  std::string out = "policy=" + std::string{to_string(config.policy)};
  out += " bucket=" + std::string{to_string(config.bucket)};
  if (config.policy == GeneratorPolicy::kSequence) {
    out += " overflow=" + std::string{to_string(config.overflow)};
  } else {
    out += " max_attempts=" + std::to_string(config.max_dedup_attempts);
    if (config.random_machine_byte) {
      out += " machine_byte=random";
    }
  }
  return out;
}

}  // namespace horaid::id
