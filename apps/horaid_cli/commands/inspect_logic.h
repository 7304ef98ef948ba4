#pragma once

#include "horaid/core/result.h"
#include "horaid/id/hora_id.h"

#include <cstdint>
#include <ostream>
#include <string_view>

// parse_hora_id_text accepts either form an identifier is printed in:
// exactly 16 characters are parsed as hex (HoraId::from_hex), any other length
// as a decimal u64. A 16-digit decimal number is therefore read as hex.
// Input of another length that is not a decimal u64 yields kWrongLength.
[[nodiscard]] horaid::core::Result<horaid::id::HoraId, horaid::core::FormatError>
parse_hora_id_text(std::string_view text);

// execute_inspect: parse text and print every view of the identifier as JSON to out.
// Returns 1 and reports the parse error to err if text is not an identifier.
int execute_inspect(std::string_view text, std::int64_t reference_epoch_millis,
                    std::ostream& out, std::ostream& err);
