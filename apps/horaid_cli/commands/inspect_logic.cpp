#include "inspect_logic.h"

#include "horaid/id/hora_id_json.h"

#include <charconv>

horaid::core::Result<horaid::id::HoraId, horaid::core::FormatError> parse_hora_id_text(
    const std::string_view text) {
  using R = horaid::core::Result<horaid::id::HoraId, horaid::core::FormatError>;

  if (text.size() == horaid::id::HoraId::kHexLength) {
    return horaid::id::HoraId::from_hex(text);
  }

  // from_chars accepts neither a sign nor whitespace, so only plain digits pass.
  std::uint64_t value = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
    return R::err(horaid::core::FormatError::kWrongLength);
  }
  return R::ok(horaid::id::HoraId::from_u64(value));
}

int execute_inspect(const std::string_view text, const std::int64_t reference_epoch_millis,
                    std::ostream& out, std::ostream& err) {
  const auto parsed = parse_hora_id_text(text);
  if (!parsed.has_value()) {
    err << "Not an identifier: '" << text << "' (" << horaid::core::to_string(parsed.error())
        << ")\n";
    return 1;
  }

  out << horaid::id::hora_id_to_json(parsed.value(), reference_epoch_millis).dump(2) << "\n";
  return 0;
}
