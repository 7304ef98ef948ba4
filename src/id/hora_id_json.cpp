#include "horaid/id/hora_id_json.h"

namespace horaid::id {

nlohmann::json hora_id_to_json(const HoraId& id, const std::int64_t reference_epoch_millis) {
  nlohmann::json j;
  j["hex"] = id.to_hex();
  j["u64"] = id.to_u64();
  j["time_high"] = id.time_high();
  j["time_low"] = id.time_low();
  j["machine_id"] = id.machine_id();
  j["sequence"] = id.sequence();
  j["unix_millis"] = id.decode_unix_millis(reference_epoch_millis);
  j["iso8601"] = to_iso8601(id, reference_epoch_millis);
  return j;
}

}  // namespace horaid::id
