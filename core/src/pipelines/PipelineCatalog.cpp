#include "rs/pipelines/PipelineCatalog.hpp"

namespace rs {

const PipelineSpec* findPipeline(const std::string& key) {
  static const PipelineSpec kPipelines[] = {
    {kArcPipeline, VertexFormat::Pos2_Clip, 3},
  };
  for (const PipelineSpec& p : kPipelines) {
    if (key == p.key) return &p;
  }
  return nullptr;
}

} // namespace rs
