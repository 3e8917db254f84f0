#include "rs/export/FrameSnapshot.hpp"
#include <cstdio>
#include <vector>

namespace rs {

namespace {

bool writePPMImpl(const std::string& path, const std::uint8_t* pixels,
                  int width, int height, bool flip) {
  if (!pixels || width <= 0 || height <= 0) return false;

  FILE* f = std::fopen(path.c_str(), "wb");
  if (!f) {
    std::fprintf(stderr, "writePPM: cannot open %s\n", path.c_str());
    return false;
  }

  std::fprintf(f, "P6\n%d %d\n255\n", width, height);

  std::vector<std::uint8_t> row(static_cast<std::size_t>(width) * 3);
  bool ok = true;
  for (int r = 0; r < height && ok; ++r) {
    int y = flip ? (height - 1 - r) : r;
    const std::uint8_t* src = pixels + static_cast<std::size_t>(y) * width * 4;
    for (int x = 0; x < width; ++x) {
      row[x * 3 + 0] = src[x * 4 + 0];
      row[x * 3 + 1] = src[x * 4 + 1];
      row[x * 3 + 2] = src[x * 4 + 2];
    }
    ok = std::fwrite(row.data(), 1, row.size(), f) == row.size();
  }

  if (std::fclose(f) != 0) ok = false;
  return ok;
}

} // namespace

bool writePPM(const std::string& path, const std::uint8_t* pixels, int width, int height) {
  return writePPMImpl(path, pixels, width, height, false);
}

bool writePPMFlipped(const std::string& path, const std::uint8_t* pixels, int width, int height) {
  return writePPMImpl(path, pixels, width, height, true);
}

} // namespace rs
