#include "generate.h"

#include "horaid/core/clock.h"
#include "horaid/core/version.h"
#include "horaid/id/generator.h"
#include "horaid/id/locked_generator.h"

#include "bench_logic.h"
#include "generate_logic.h"
#include "generator_options.h"
#include "shared/arg_parser.h"
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace {

// GeneratorSetup bundles everything cmd_generate and cmd_bench need after
// flag parsing. The clock must outlive the generator, so both live here.
struct GeneratorSetup {
  GeneratorCliConfig config;
  std::unique_ptr<horaid::core::SystemClock> clock;
  std::shared_ptr<horaid::id::IHoraGenerator> generator;
};

// Parse flags, resolve machine id, validate, print the startup diagnostic block
// and build the generator, or print the error and return nullopt.
std::optional<GeneratorSetup> setup_generator(int argc,
                                              char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = generator_option_registry();
  auto parsed = horaid::apps::parse_options(argc, argv, options, 2);
  if (parsed.error_count > 0) {
    return std::nullopt;
  }
  if (!parsed.positionals.empty()) {
    std::cerr << "Unexpected argument: " << parsed.positionals.front() << "\n";
    return std::nullopt;
  }

  const auto machine_id = resolve_machine_id(parsed.config, std::getenv(kMachineIdEnvVar),
                                             std::cerr);  // NOLINT(concurrency-mt-unsafe)
  if (!machine_id.has_value()) {
    return std::nullopt;
  }

  const std::string config_error = horaid::id::validate_generator_config(parsed.config.generator);
  if (!config_error.empty()) {
    std::cerr << config_error << "\n";
    return std::nullopt;
  }

  // ── Startup diagnostic block (stderr keeps stdout machine-readable) ──────
  std::cerr << "horaid v" << horaid::core::kBuildVersion << " (format v"
            << horaid::id::kFormatVersion << ")\n";
  std::cerr << "Machine id:  " << static_cast<int>(machine_id.value()) << "\n";
  std::cerr << "Generator:   " << horaid::id::generator_config_to_log_string(parsed.config.generator)
            << "\n";

  GeneratorSetup setup{parsed.config, std::make_unique<horaid::core::SystemClock>(), nullptr};
  auto gen_result =
      horaid::id::create_generator(machine_id.value(), *setup.clock, setup.config.generator);
  if (!gen_result.has_value()) {
    std::cerr << "Failed to create generator: " << horaid::core::to_string(gen_result.error())
              << "\n";
    return std::nullopt;
  }
  setup.generator = gen_result.value();
  return setup;
}

}  // namespace

int cmd_generate(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  auto setup = setup_generator(argc, argv);
  if (!setup.has_value()) {
    return 1;
  }
  return execute_generate(*setup->generator, setup->config, std::cout, std::cerr);
}

int cmd_bench(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  auto setup = setup_generator(argc, argv);
  if (!setup.has_value()) {
    return 1;
  }

  std::shared_ptr<horaid::id::IHoraGenerator> gen = setup->generator;
  if (setup->config.threads > 1) {
    std::cerr << "Threads:     " << setup->config.threads << " (shared locked generator)\n";
    gen = std::make_shared<horaid::id::LockedGenerator>(gen);
  }

  const auto report = run_bench(*gen, setup->config.count, setup->config.threads);
  std::cout << bench_report_to_json(report).dump(2) << "\n";
  return report.duplicates == 0 ? 0 : 1;
}
