#pragma once
#include <cstdint>

namespace rs {

// Scene resource id. Recipes allocate deterministic ranges (idBase + slot).
using Id = std::uint64_t;

inline constexpr Id kInvalidId = 0;

} // namespace rs
