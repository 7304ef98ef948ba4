#pragma once

#include <cstdint>

namespace horaid::id {

// kReferenceEpochMillis is time zero for every HoraId: 2025-01-01T00:00:00Z in
// milliseconds since the Unix epoch.
//
// LOCKED (format v1): changing this constant changes the meaning of every
// identifier already issued. A new value requires bumping kFormatVersion.
constexpr std::int64_t kReferenceEpochMillis = 1735689600000;

// kFormatVersion identifies the byte layout and reference epoch pair.
constexpr int kFormatVersion = 1;

}  // namespace horaid::id
