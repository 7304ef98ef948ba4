#pragma once

namespace horaid::core {

// kBuildVersion is the current software version string.
// Updated once per release slice.
constexpr const char* kBuildVersion = "0.3";

}  // namespace horaid::core
