#pragma once

#include "horaid/id/generator_config.h"

#include "shared/arg_parser.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string_view>
#include <vector>

// kMachineIdEnvVar names the environment variable consulted when --machine-id is absent.
constexpr const char* kMachineIdEnvVar = "HORAID_MACHINE_ID";

// OutputFormat selects how generated identifiers are printed.
enum class OutputFormat : uint8_t {
  kHex,   // "hex" : 16 lower-case hex characters
  kU64,   // "u64" : decimal unsigned integer
  kJson,  // "json": one JSON object per line (hora_id_to_json)
};

[[nodiscard]] std::optional<OutputFormat> parse_output_format(std::string_view s);

// GeneratorCliConfig holds the flags shared by the generate and bench subcommands.
struct GeneratorCliConfig {
  std::optional<std::uint8_t> machine_id;  // NOLINT(readability-identifier-naming)
  horaid::id::GeneratorConfig generator;   // NOLINT(readability-identifier-naming)
  std::size_t count{1};                    // NOLINT(readability-identifier-naming)
  OutputFormat format{OutputFormat::kHex};  // NOLINT(readability-identifier-naming)
  std::int64_t interval_ms{0};             // NOLINT(readability-identifier-naming)
  // bench only: worker threads sharing one LockedGenerator.
  std::size_t threads{1};  // NOLINT(readability-identifier-naming)
};

// generator_option_registry returns the option table for generate / bench.
[[nodiscard]] std::vector<horaid::apps::Option<GeneratorCliConfig>> generator_option_registry();

// resolve_machine_id picks the machine id: --machine-id wins, then env_value
// (the HORAID_MACHINE_ID value, nullptr if unset), else 0 with a warning.
// Returns nullopt (after printing the reason to err) if env_value is malformed.
[[nodiscard]] std::optional<std::uint8_t> resolve_machine_id(const GeneratorCliConfig& config,
                                                             const char* env_value,
                                                             std::ostream& err);
