#include "generate_logic.h"

#include "horaid/id/hora_id_json.h"

#include <chrono>
#include <cstddef>
#include <thread>

std::string format_hora_id(const horaid::id::HoraId& id, const OutputFormat format,
                           const std::int64_t reference_epoch_millis) {
  switch (format) {
    case OutputFormat::kHex:
      return id.to_hex();
    case OutputFormat::kU64:
      return std::to_string(id.to_u64());
    case OutputFormat::kJson:
      return horaid::id::hora_id_to_json(id, reference_epoch_millis).dump();
  }
  return id.to_hex();  // unreachable: all enumerators covered above
}

int execute_generate(horaid::id::IHoraGenerator& gen, const GeneratorCliConfig& config,
                     std::ostream& out, std::ostream& err) {
  for (std::size_t i = 0; i < config.count; ++i) {
    if (i > 0 && config.interval_ms > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(config.interval_ms));
    }

    const auto result = gen.next();
    if (!result.has_value()) {
      err << "Generation failed after " << i << " identifiers: "
          << horaid::core::to_string(result.error()) << "\n";
      return 1;
    }

    out << format_hora_id(result.value(), config.format, config.generator.reference_epoch_millis)
        << "\n";
  }
  return 0;
}
