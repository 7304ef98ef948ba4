#include "inspect.h"

#include "horaid/id/reference_epoch.h"

#include "inspect_logic.h"
#include "shared/arg_parser.h"
#include <charconv>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace {

struct InspectCliConfig {
  std::int64_t reference_epoch_millis{horaid::id::kReferenceEpochMillis};
};

}  // namespace

int cmd_inspect(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<horaid::apps::Option<InspectCliConfig>> options = {
      {"--reference-epoch", true, "Reference epoch in Unix milliseconds the id was issued under",
       [](InspectCliConfig& c, const std::string& v) {
         std::int64_t epoch = 0;
         const auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), epoch);
         if (ec != std::errc{} || ptr != v.data() + v.size() || epoch < 0) {
           std::cerr << "Invalid --reference-epoch: " << v << " (must be >= 0)\n";
           return false;
         }
         c.reference_epoch_millis = epoch;
         return true;
       }},
  };
  auto parsed = horaid::apps::parse_options(argc, argv, options, 2);
  if (parsed.error_count > 0) {
    return 1;
  }

  if (parsed.positionals.size() != 1) {
    std::cerr << "Usage: horaid_cli inspect <hex-or-u64> [--reference-epoch <ms>]\n";
    return 1;
  }

  return execute_inspect(parsed.positionals.front(), parsed.config.reference_epoch_millis,
                         std::cout, std::cerr);
}
