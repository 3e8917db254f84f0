#pragma once
#include "rs/commands/CommandProcessor.hpp"
#include "rs/recipe/RoundScrollbarRecipe.hpp"
#include "rs/render/ArcPainter.hpp"
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace rs {

// ArcPainter that writes into a scene built by RoundScrollbarRecipe:
// tessellated vertices go to CPU-side buffers keyed by buffer id, and
// vertex counts and colors are applied as commands.
class SceneArcPainter : public ArcPainter {
public:
  SceneArcPainter(CommandProcessor& cp, const RoundScrollbarRecipe& recipe,
                  int viewW, int viewH);

  void setViewSize(int viewW, int viewH);
  int viewWidth() const { return viewW_; }
  int viewHeight() const { return viewH_; }

  void paint(const ScrollbarFrame& frame) override;

  // Empty for unknown ids.
  const std::vector<float>& vertexData(Id bufferId) const;

  // Buffers written since the last call.
  std::vector<Id> takeDirtyBuffers();

  std::uint64_t paintCount() const { return paintCount_; }
  std::uint64_t failedCommands() const { return failedCommands_; }

private:
  void apply(const std::string& cmd);
  void writeArc(Id bufferId, Id geometryId, Id drawItemId,
                std::vector<float> verts, const float color[4]);

  CommandProcessor& cp_;
  const RoundScrollbarRecipe& recipe_;
  int viewW_;
  int viewH_;
  std::unordered_map<Id, std::vector<float>> vertices_;
  std::vector<Id> dirty_;
  std::uint64_t paintCount_{0};
  std::uint64_t failedCommands_{0};
};

} // namespace rs
