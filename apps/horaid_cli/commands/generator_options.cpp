#include "generator_options.h"

#include <charconv>
#include <iostream>
#include <string>

namespace {

// ────────────────────────────────────────────────────────────────
// Option Handlers
// ────────────────────────────────────────────────────────────────

bool handle_machine_id(GeneratorCliConfig& config, const std::string& value) {
  const auto parsed = horaid::id::parse_machine_id(value);
  if (!parsed.has_value()) {
    std::cerr << "Invalid --machine-id: " << value << " (valid: 0..255)\n";
    return false;
  }
  config.machine_id = parsed;
  return true;
}

bool handle_count(GeneratorCliConfig& config, const std::string& value) {
  std::size_t count = 0;
  const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), count);
  if (ec != std::errc{} || ptr != value.data() + value.size() || count == 0) {
    std::cerr << "Invalid --count: " << value << " (must be a positive integer)\n";
    return false;
  }
  config.count = count;
  return true;
}

bool handle_interval(GeneratorCliConfig& config, const std::string& value) {
  std::int64_t interval = 0;
  const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), interval);
  if (ec != std::errc{} || ptr != value.data() + value.size() || interval < 0) {
    std::cerr << "Invalid --interval-ms: " << value << " (must be >= 0)\n";
    return false;
  }
  config.interval_ms = interval;
  return true;
}

bool handle_threads(GeneratorCliConfig& config, const std::string& value) {
  std::size_t threads = 0;
  const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), threads);
  if (ec != std::errc{} || ptr != value.data() + value.size() || threads == 0 || threads > 256) {
    std::cerr << "Invalid --threads: " << value << " (valid: 1..256)\n";
    return false;
  }
  config.threads = threads;
  return true;
}

bool handle_policy(GeneratorCliConfig& config, const std::string& value) {
  const auto parsed = horaid::id::parse_generator_policy(value);
  if (!parsed.has_value()) {
    std::cerr << "Invalid --policy: " << value << " (valid: sequence, dedup)\n";
    return false;
  }
  config.generator.policy = parsed.value();
  return true;
}

bool handle_bucket(GeneratorCliConfig& config, const std::string& value) {
  const auto parsed = horaid::id::parse_bucket_resolution(value);
  if (!parsed.has_value()) {
    std::cerr << "Invalid --bucket: " << value << " (valid: tick, second)\n";
    return false;
  }
  config.generator.bucket = parsed.value();
  return true;
}

bool handle_overflow(GeneratorCliConfig& config, const std::string& value) {
  const auto parsed = horaid::id::parse_sequence_overflow(value);
  if (!parsed.has_value()) {
    std::cerr << "Invalid --overflow: " << value << " (valid: fail, wrap)\n";
    return false;
  }
  config.generator.overflow = parsed.value();
  return true;
}

bool handle_format(GeneratorCliConfig& config, const std::string& value) {
  const auto parsed = parse_output_format(value);
  if (!parsed.has_value()) {
    std::cerr << "Invalid --format: " << value << " (valid: hex, u64, json)\n";
    return false;
  }
  config.format = parsed.value();
  return true;
}

bool handle_random_machine_byte(GeneratorCliConfig& config, const std::string& /*value*/) {
  config.generator.random_machine_byte = true;
  return true;
}

}  // namespace

std::optional<OutputFormat> parse_output_format(const std::string_view s) {
  if (s == "hex") {
    return OutputFormat::kHex;
  }
  if (s == "u64") {
    return OutputFormat::kU64;
  }
  if (s == "json") {
    return OutputFormat::kJson;
  }
  return std::nullopt;
}

// ────────────────────────────────────────────────────────────────
// Option Registry
// ────────────────────────────────────────────────────────────────

std::vector<horaid::apps::Option<GeneratorCliConfig>> generator_option_registry() {
  return {
      {"--machine-id", true, "Machine id 0..255 (default: $HORAID_MACHINE_ID, else 0)",
       handle_machine_id},
      {"--count", true, "Number of identifiers to generate", handle_count},
      {"--policy", true, "Anti-collision policy (sequence|dedup)", handle_policy},
      {"--bucket", true, "Bucket resolution (tick|second)", handle_bucket},
      {"--overflow", true, "Sequence overflow behaviour (fail|wrap)", handle_overflow},
      {"--random-machine-byte", false, "Dedup only: randomize byte 5 instead of machine id",
       handle_random_machine_byte},
      {"--format", true, "Output format (hex|u64|json)", handle_format},
      {"--interval-ms", true, "Sleep between identifiers in milliseconds", handle_interval},
      {"--threads", true, "bench only: threads sharing one locked generator", handle_threads},
  };
}

std::optional<std::uint8_t> resolve_machine_id(const GeneratorCliConfig& config,
                                               const char* env_value, std::ostream& err) {
  if (config.machine_id.has_value()) {
    return config.machine_id;
  }

  if (env_value != nullptr) {
    const auto parsed = horaid::id::parse_machine_id(env_value);
    if (!parsed.has_value()) {
      err << "Invalid " << kMachineIdEnvVar << ": " << env_value << " (valid: 0..255)\n";
      return std::nullopt;
    }
    return parsed;
  }

  err << "WARNING: no --machine-id or " << kMachineIdEnvVar
      << " set, using machine id 0. Identifiers are unique only on this machine.\n";
  return std::uint8_t{0};
}
