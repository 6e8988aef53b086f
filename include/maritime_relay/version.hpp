// === Version Metadata ========================================================
//
// Exposes the relay's semantic version string used in logs.

#pragma once

#include <string_view>

namespace maritime_relay {

inline constexpr std::string_view k_version{"0.3.0"};

}  // namespace maritime_relay
