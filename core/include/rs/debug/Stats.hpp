#pragma once
#include <cstdint>

namespace rs {

struct Stats {
  std::uint32_t drawCalls = 0;
  std::uint32_t skippedDrawItems = 0;  // transparent, empty or not yet uploaded

  std::uint32_t activeBuffers = 0;
};

} // namespace rs
