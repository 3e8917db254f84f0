#pragma once
#include <cstdint>
#include <string>

namespace rs {

// Write RGBA pixels to a binary PPM (RGB, alpha dropped).
bool writePPM(const std::string& path,
              const std::uint8_t* pixels,
              int width, int height);

// Same, flipping rows (glReadPixels is bottom-up; PPM is top-down).
bool writePPMFlipped(const std::string& path,
                     const std::uint8_t* pixels,
                     int width, int height);

} // namespace rs
