#include "horaid/core/version.h"
#include "horaid/id/reference_epoch.h"

#include "commands/generate.h"
#include "commands/generator_options.h"
#include "commands/inspect.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cout << "horaid_cli v" << horaid::core::kBuildVersion
            << " - time-sorted 8-byte identifiers\n\n"
            << "Usage:\n"
            << "  horaid_cli generate [options]           print identifiers\n"
            << "  horaid_cli bench [options]              measure throughput, count duplicates\n"
            << "  horaid_cli inspect <hex-or-u64> [--reference-epoch <ms>]\n"
            << "  horaid_cli --version\n\n"
            << "generate / bench options:\n";
  horaid::apps::print_options(std::cout, generator_option_registry());
  std::cout << "\nReference epoch: " << horaid::id::kReferenceEpochMillis
            << " ms (2025-01-01T00:00:00Z), format v" << horaid::id::kFormatVersion << "\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "generate") {
    return cmd_generate(argc, argv);
  }
  if (subcommand == "bench") {
    return cmd_bench(argc, argv);
  }
  if (subcommand == "inspect") {
    return cmd_inspect(argc, argv);
  }
  if (subcommand == "--version") {
    std::cout << horaid::core::kBuildVersion << "\n";
    return 0;
  }
  if (subcommand == "help" || subcommand == "--help" || subcommand == "-h") {
    print_usage();
    return 0;
  }

  std::cerr << "Unknown subcommand: " << subcommand << "\n";
  print_usage();
  return 1;
}
