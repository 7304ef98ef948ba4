#include "horaid/id/generator_config.h"

#include <catch2/catch_test_macros.hpp>

using namespace horaid::id;

// ── parse_machine_id ────────────────────────────────────────────────────────

TEST_CASE("parse_machine_id: accepts decimal 0..255", "[config][machine_id]") {
  CHECK(parse_machine_id("0") == std::uint8_t{0});
  CHECK(parse_machine_id("7") == std::uint8_t{7});
  CHECK(parse_machine_id("007") == std::uint8_t{7});
  CHECK(parse_machine_id("255") == std::uint8_t{255});
}

TEST_CASE("parse_machine_id: rejects everything else", "[config][machine_id]") {
  CHECK_FALSE(parse_machine_id("").has_value());
  CHECK_FALSE(parse_machine_id("256").has_value());
  CHECK_FALSE(parse_machine_id("99999999999999999999").has_value());
  CHECK_FALSE(parse_machine_id("-1").has_value());
  CHECK_FALSE(parse_machine_id("+1").has_value());
  CHECK_FALSE(parse_machine_id("1a").has_value());
  CHECK_FALSE(parse_machine_id(" 1").has_value());
  CHECK_FALSE(parse_machine_id("0x10").has_value());
}

// ── vocabularies ────────────────────────────────────────────────────────────

TEST_CASE("policy, bucket and overflow vocabularies round-trip", "[config][vocabulary]") {
  for (const auto p : {GeneratorPolicy::kSequence, GeneratorPolicy::kDedup}) {
    CHECK(parse_generator_policy(to_string(p)) == p);
  }
  for (const auto b : {BucketResolution::kTick, BucketResolution::kSecond}) {
    CHECK(parse_bucket_resolution(to_string(b)) == b);
  }
  for (const auto o : {SequenceOverflow::kFail, SequenceOverflow::kWrap}) {
    CHECK(parse_sequence_overflow(to_string(o)) == o);
  }
}

TEST_CASE("vocabulary parsing is case-sensitive and rejects unknown values",
          "[config][vocabulary]") {
  CHECK_FALSE(parse_generator_policy("").has_value());
  CHECK_FALSE(parse_generator_policy("Sequence").has_value());
  CHECK_FALSE(parse_generator_policy("random").has_value());
  CHECK_FALSE(parse_bucket_resolution("ms").has_value());
  CHECK_FALSE(parse_sequence_overflow("ignore").has_value());
}

// ── defaults and validation ─────────────────────────────────────────────────

TEST_CASE("default GeneratorConfig is a production sequence generator", "[config]") {
  const GeneratorConfig config;
  CHECK(config.policy == GeneratorPolicy::kSequence);
  CHECK(config.bucket == BucketResolution::kTick);
  CHECK(config.overflow == SequenceOverflow::kFail);
  CHECK(config.max_dedup_attempts == kDefaultMaxDedupAttempts);
  CHECK_FALSE(config.random_seed.has_value());
  CHECK(config.reference_epoch_millis == kReferenceEpochMillis);
  CHECK(validate_generator_config(config).empty());
}

TEST_CASE("validate_generator_config rejects inconsistent settings", "[config]") {
  SECTION("negative reference epoch") {
    GeneratorConfig config;
    config.reference_epoch_millis = -1;
    CHECK_FALSE(validate_generator_config(config).empty());
  }

  SECTION("dedup with zero attempts") {
    GeneratorConfig config;
    config.policy = GeneratorPolicy::kDedup;
    config.max_dedup_attempts = 0;
    CHECK_FALSE(validate_generator_config(config).empty());
  }

  SECTION("zero attempts is irrelevant for the sequence policy") {
    GeneratorConfig config;
    config.max_dedup_attempts = 0;
    CHECK(validate_generator_config(config).empty());
  }
}

TEST_CASE("generator_config_to_log_string is deterministic", "[config]") {
  GeneratorConfig config;
  CHECK(generator_config_to_log_string(config) == "policy=sequence bucket=tick overflow=fail");

  config.policy = GeneratorPolicy::kDedup;
  config.bucket = BucketResolution::kSecond;
  CHECK(generator_config_to_log_string(config) == "policy=dedup bucket=second max_attempts=1000");

  config.random_machine_byte = true;
  CHECK(generator_config_to_log_string(config) ==
        "policy=dedup bucket=second max_attempts=1000 machine_byte=random");
}
