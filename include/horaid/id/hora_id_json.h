#pragma once

#include "horaid/id/hora_id.h"

#include <nlohmann/json.hpp>

#include <cstdint>

namespace horaid::id {

// hora_id_to_json returns every view of an identifier as a JSON object:
// hex, u64, the four layout fields, and the decoded instant
// (unix_millis, iso8601) relative to reference_epoch_millis.
//
// nlohmann::json default object type is std::map, so keys serialize sorted.
[[nodiscard]] nlohmann::json hora_id_to_json(
    const HoraId& id, std::int64_t reference_epoch_millis = kReferenceEpochMillis);

}  // namespace horaid::id
