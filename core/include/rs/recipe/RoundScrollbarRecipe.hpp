#pragma once
#include "rs/geometry/ArcGeometry.hpp"
#include "rs/recipe/Recipe.hpp"
#include "rs/scrollbar/ScrollbarFrame.hpp"
#include <string>
#include <vector>

namespace rs {

// Circular scrollbar as two stroked arcs tessellated into triSolid@1
// triangles (pos2_clip). The track is created first so it draws under the thumb.
//
// ID layout (6 slots):
//   0-2: track (buffer, geom, drawItem)
//   3-5: thumb (buffer, geom, drawItem)
struct RoundScrollbarRecipeConfig {
  Id paneId{0};
  Id layerId{0};
  std::string name;
  float maxSegmentAngle{0.035f};  // radians per stroke quad
  int capSegments{8};             // triangles per round cap
};

class RoundScrollbarRecipe : public Recipe {
public:
  RoundScrollbarRecipe(Id idBase, const RoundScrollbarRecipeConfig& config);

  RecipeBuildResult build() const override;
  std::vector<Id> drawItemIds() const override {
    return {trackDrawItemId(), thumbDrawItemId()};
  }

  Id trackBufferId() const   { return rid(0); }
  Id trackGeometryId() const { return rid(1); }
  Id trackDrawItemId() const { return rid(2); }
  Id thumbBufferId() const   { return rid(3); }
  Id thumbGeometryId() const { return rid(4); }
  Id thumbDrawItemId() const { return rid(5); }

  static constexpr std::uint32_t ID_SLOTS = 6;

  struct ArcData {
    std::vector<float> trackVerts;  // x,y pairs in clip space
    std::vector<float> thumbVerts;
    float trackColor[4];            // alpha already multiplied by opacity
    float thumbColor[4];
  };

  ArcData computeArcs(const ScrollbarFrame& frame, int viewW, int viewH) const;

  // Stroke of an elliptical arc with round caps, as clip-space triangles.
  // Zero sweep, zero stroke, an empty rect or an empty view yield nothing.
  std::vector<float> tessellateArc(const ArcRect& rect, float startAngle, float sweep,
                                   float strokeWidth, int viewW, int viewH) const;

private:
  RoundScrollbarRecipeConfig config_;
};

} // namespace rs
