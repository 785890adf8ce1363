#pragma once
#include <cstddef>
#include <cstdint>

namespace kravgen {

inline constexpr const char* TOOL_NAME = "kravgen";

// Key used by the published Kravatte test vectors.
inline constexpr const char* DEFAULT_KEY = "kravatte test key";

inline constexpr std::int64_t DEFAULT_OUT_BYTES = 32;

// Separator line around each printed test case.
inline constexpr const char* RULE = "-----------";

} // namespace kravgen
