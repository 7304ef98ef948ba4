#pragma once

#include "horaid/id/generator.h"
#include "horaid/id/hora_id.h"

#include "generator_options.h"
#include <cstdint>
#include <ostream>
#include <string>

// format_hora_id renders one identifier in the requested output format.
[[nodiscard]] std::string format_hora_id(const horaid::id::HoraId& id, OutputFormat format,
                                         std::int64_t reference_epoch_millis);

// execute_generate: issue config.count identifiers from gen and print one per line to out.
// Stops at the first generator error, reports it to err and returns 1.
// Takes only the generator interface: the caller owns the clock and policy choice.
int execute_generate(horaid::id::IHoraGenerator& gen, const GeneratorCliConfig& config,
                     std::ostream& out, std::ostream& err);
