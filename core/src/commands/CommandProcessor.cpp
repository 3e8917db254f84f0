#include "rs/commands/CommandProcessor.hpp"
#include "rs/pipelines/PipelineCatalog.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <optional>
#include <string>
#include <vector>

namespace rs {

namespace {

std::string idDetails(const char* field, Id id) {
  return std::string(R"({")") + field + R"(":)" + std::to_string(id) + "}";
}

} // namespace

CommandProcessor::CommandProcessor(Scene& scene, ResourceRegistry& registry)
  : scene_(scene), reg_(registry) {}

CmdResult CommandProcessor::fail(const std::string& code,
                                 const std::string& message,
                                 const std::string& detailsJson) {
  CmdResult r;
  r.ok = false;
  r.err.code = code;
  r.err.message = message;
  r.err.details = detailsJson.empty() ? "{}" : detailsJson;
  return r;
}

CmdResult CommandProcessor::okResult(Id createdId) {
  CmdResult r;
  r.ok = true;
  r.createdId = createdId;
  return r;
}

const rapidjson::Value* CommandProcessor::getMember(const rapidjson::Value& obj, const char* key) {
  if (!obj.IsObject()) return nullptr;
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return nullptr;
  return &it->value;
}

std::string CommandProcessor::getStringOrEmpty(const rapidjson::Value& obj, const char* key) {
  const auto* v = getMember(obj, key);
  if (!v || !v->IsString()) return {};
  return v->GetString();
}

Id CommandProcessor::getIdOrZero(const rapidjson::Value& obj, const char* key) {
  const auto* v = getMember(obj, key);
  if (!v) return 0;

  // Ids are unsigned JSON integers; anything else reads as "no id".
  return v->IsUint64() ? static_cast<Id>(v->GetUint64()) : kInvalidId;
}

CmdResult CommandProcessor::claimId(const rapidjson::Value& obj, ResourceKind kind,
                                    const char* cmdName) {
  Id id = getIdOrZero(obj, "id");
  if (id == 0) return okResult(reg_.allocate(kind));
  if (!reg_.reserve(id, kind)) {
    return fail("ID_TAKEN", std::string(cmdName) + ": id already exists", idDetails("id", id));
  }
  return okResult(id);
}

CmdResult CommandProcessor::applyJsonText(const std::string& jsonText) {
  rapidjson::Document d;
  d.Parse(jsonText.c_str());

  if (d.HasParseError() || !d.IsObject()) {
    return fail("BAD_COMMAND", "CommandProcessor: invalid JSON object");
  }
  return applyJson(d);
}

CmdResult CommandProcessor::applyJson(const rapidjson::Value& obj) {
  const auto* cmdV = getMember(obj, "cmd");
  if (!cmdV || !cmdV->IsString()) {
    return fail("BAD_COMMAND", "Missing string field: cmd");
  }

  const std::string cmd = cmdV->GetString();

  // Graph
  if (cmd == "createPane") return cmdCreatePane(obj);
  if (cmd == "createLayer") return cmdCreateLayer(obj);
  if (cmd == "createDrawItem") return cmdCreateDrawItem(obj);
  if (cmd == "delete") return cmdDelete(obj);

  // Geometry plumbing
  if (cmd == "createBuffer") return cmdCreateBuffer(obj);
  if (cmd == "createGeometry") return cmdCreateGeometry(obj);
  if (cmd == "bindDrawItem") return cmdBindDrawItem(obj);

  // Per-frame updates
  if (cmd == "setDrawItemColor") return cmdSetDrawItemColor(obj);
  if (cmd == "setGeometryVertexCount") return cmdSetGeometryVertexCount(obj);
  if (cmd == "setBufferByteLength") return cmdSetBufferByteLength(obj);

  return fail("UNKNOWN_COMMAND",
              "Unknown cmd",
              std::string(R"({"cmd":")") + cmd + R"("})");
}

// -------------------- graph --------------------

CmdResult CommandProcessor::cmdCreatePane(const rapidjson::Value& obj) {
  CmdResult claimed = claimId(obj, ResourceKind::Pane, "createPane");
  if (!claimed.ok) return claimed;

  Pane p;
  p.id = claimed.createdId;
  p.name = getStringOrEmpty(obj, "name");
  scene_.addPane(std::move(p));
  return claimed;
}

CmdResult CommandProcessor::cmdCreateLayer(const rapidjson::Value& obj) {
  const Id paneId = getIdOrZero(obj, "paneId");
  if (paneId == 0 || !scene_.hasPane(paneId)) {
    return fail("VALIDATION_INVALID_PARENT", "createLayer: invalid paneId",
                idDetails("paneId", paneId));
  }

  CmdResult claimed = claimId(obj, ResourceKind::Layer, "createLayer");
  if (!claimed.ok) return claimed;

  Layer l;
  l.id = claimed.createdId;
  l.paneId = paneId;
  l.name = getStringOrEmpty(obj, "name");
  scene_.addLayer(std::move(l));
  return claimed;
}

CmdResult CommandProcessor::cmdCreateDrawItem(const rapidjson::Value& obj) {
  const Id layerId = getIdOrZero(obj, "layerId");
  if (layerId == 0 || !scene_.hasLayer(layerId)) {
    return fail("VALIDATION_INVALID_PARENT", "createDrawItem: invalid layerId",
                idDetails("layerId", layerId));
  }

  CmdResult claimed = claimId(obj, ResourceKind::DrawItem, "createDrawItem");
  if (!claimed.ok) return claimed;

  DrawItem d;
  d.id = claimed.createdId;
  d.layerId = layerId;
  d.name = getStringOrEmpty(obj, "name");
  // pipeline + geometry are set by bindDrawItem
  scene_.addDrawItem(std::move(d));
  return claimed;
}

CmdResult CommandProcessor::cmdDelete(const rapidjson::Value& obj) {
  const Id id = getIdOrZero(obj, "id");
  if (id == 0) return fail("BAD_COMMAND", "delete: missing/invalid id");
  const std::optional<ResourceKind> kind = reg_.kindOf(id);
  if (!kind) return fail("NOT_FOUND", "delete: id does not exist", idDetails("id", id));

  std::vector<Id> deleted;
  switch (*kind) {
    case ResourceKind::Pane:     deleted = scene_.deletePane(id); break;
    case ResourceKind::Layer:    deleted = scene_.deleteLayer(id); break;
    case ResourceKind::DrawItem: deleted = scene_.deleteDrawItem(id); break;
    case ResourceKind::Buffer:   deleted = scene_.deleteBuffer(id); break;
    case ResourceKind::Geometry: deleted = scene_.deleteGeometry(id); break;
  }

  if (deleted.empty()) return fail("DELETE_FAILED", "delete: failed", idDetails("id", id));

  for (Id did : deleted) reg_.release(did);
  return okResult();
}

// -------------------- geometry plumbing --------------------

CmdResult CommandProcessor::cmdCreateBuffer(const rapidjson::Value& obj) {
  const auto* bl = getMember(obj, "byteLength");
  if (!bl || !bl->IsUint()) {
    return fail("BAD_COMMAND", "createBuffer: missing uint byteLength");
  }

  CmdResult claimed = claimId(obj, ResourceKind::Buffer, "createBuffer");
  if (!claimed.ok) return claimed;

  Buffer b;
  b.id = claimed.createdId;
  b.byteLength = bl->GetUint();
  scene_.addBuffer(b);
  return claimed;
}

CmdResult CommandProcessor::cmdCreateGeometry(const rapidjson::Value& obj) {
  const Id vb = getIdOrZero(obj, "vertexBufferId");
  if (vb == 0 || !scene_.hasBuffer(vb)) {
    return fail("MISSING_BUFFER", "createGeometry: invalid vertexBufferId",
                idDetails("vertexBufferId", vb));
  }

  const auto* vc = getMember(obj, "vertexCount");
  if (!vc || !vc->IsUint()) {
    return fail("BAD_COMMAND", "createGeometry: missing uint vertexCount");
  }

  if (const auto* f = getMember(obj, "format"); f && f->IsString()) {
    if (std::string(f->GetString()) != toString(VertexFormat::Pos2_Clip)) {
      return fail("UNSUPPORTED_VERTEX_FORMAT",
                  "createGeometry: only format=pos2_clip supported",
                  R"({"supported":["pos2_clip"]})");
    }
  }

  CmdResult claimed = claimId(obj, ResourceKind::Geometry, "createGeometry");
  if (!claimed.ok) return claimed;

  Geometry g;
  g.id = claimed.createdId;
  g.vertexBufferId = vb;
  g.format = VertexFormat::Pos2_Clip;
  g.vertexCount = vc->GetUint();
  scene_.addGeometry(g);
  return claimed;
}

CmdResult CommandProcessor::cmdBindDrawItem(const rapidjson::Value& obj) {
  const Id drawItemId = getIdOrZero(obj, "drawItemId");
  DrawItem* di = scene_.getDrawItemMutable(drawItemId);
  if (!di) {
    return fail("MISSING_DRAWITEM", "bindDrawItem: drawItemId does not exist",
                idDetails("drawItemId", drawItemId));
  }

  const std::string pipeline = getStringOrEmpty(obj, "pipeline");
  if (pipeline.empty()) return fail("BAD_COMMAND", "bindDrawItem: missing pipeline");

  const Id geomId = getIdOrZero(obj, "geometryId");
  if (geomId == 0) return fail("BAD_COMMAND", "bindDrawItem: missing geometryId");

  di->pipeline = pipeline;
  di->geometryId = geomId;
  return validateDrawItem(*di);
}

// -------------------- per-frame updates --------------------

CmdResult CommandProcessor::cmdSetDrawItemColor(const rapidjson::Value& obj) {
  const Id drawItemId = getIdOrZero(obj, "drawItemId");
  DrawItem* di = scene_.getDrawItemMutable(drawItemId);
  if (!di) {
    return fail("MISSING_DRAWITEM", "setDrawItemColor: drawItemId does not exist",
                idDetails("drawItemId", drawItemId));
  }

  static const char* kKeys[4] = {"r", "g", "b", "a"};
  float rgba[4];
  for (int i = 0; i < 4; ++i) {
    const auto* v = getMember(obj, kKeys[i]);
    if (!v || !v->IsNumber()) {
      return fail("BAD_COMMAND", std::string("setDrawItemColor: missing number ") + kKeys[i]);
    }
    double c = v->GetDouble();
    if (c < 0.0 || c > 1.0) {
      return fail("BAD_COMMAND", "setDrawItemColor: components must be in [0,1]");
    }
    rgba[i] = static_cast<float>(c);
  }

  for (int i = 0; i < 4; ++i) di->color[i] = rgba[i];
  return okResult();
}

CmdResult CommandProcessor::cmdSetGeometryVertexCount(const rapidjson::Value& obj) {
  const Id geomId = getIdOrZero(obj, "geometryId");
  Geometry* g = scene_.getGeometryMutable(geomId);
  if (!g) {
    return fail("VALIDATION_BAD_GEOMETRY", "setGeometryVertexCount: geometryId does not exist",
                idDetails("geometryId", geomId));
  }

  const auto* vc = getMember(obj, "vertexCount");
  if (!vc || !vc->IsUint()) {
    return fail("BAD_COMMAND", "setGeometryVertexCount: missing uint vertexCount");
  }
  if ((vc->GetUint() % 3u) != 0u) {
    return fail("VALIDATION_BAD_VERTEX_COUNT",
                "triSolid@1 requires vertexCount multiple of 3",
                std::string(R"({"vertexCount":)") + std::to_string(vc->GetUint()) + "}");
  }

  g->vertexCount = vc->GetUint();
  return okResult();
}

CmdResult CommandProcessor::cmdSetBufferByteLength(const rapidjson::Value& obj) {
  const Id bufferId = getIdOrZero(obj, "bufferId");
  Buffer* b = scene_.getBufferMutable(bufferId);
  if (!b) {
    return fail("MISSING_BUFFER", "setBufferByteLength: bufferId does not exist",
                idDetails("bufferId", bufferId));
  }

  const auto* bl = getMember(obj, "byteLength");
  if (!bl || !bl->IsUint()) {
    return fail("BAD_COMMAND", "setBufferByteLength: missing uint byteLength");
  }

  b->byteLength = bl->GetUint();
  return okResult();
}

CmdResult CommandProcessor::validateDrawItem(const DrawItem& di) const {
  const PipelineSpec* spec = findPipeline(di.pipeline);
  if (!spec) {
    return fail("UNKNOWN_PIPELINE", "drawItem pipeline not found",
                std::string(R"({"pipeline":")") + di.pipeline + R"("})");
  }

  const Geometry* g = scene_.getGeometry(di.geometryId);
  if (!g) {
    return fail("VALIDATION_BAD_GEOMETRY", "drawItem geometryId does not exist",
                idDetails("geometryId", di.geometryId));
  }

  if (!scene_.hasBuffer(g->vertexBufferId)) {
    return fail("VALIDATION_MISSING_BUFFER",
                "geometry must reference an existing vertexBufferId",
                idDetails("vertexBufferId", g->vertexBufferId));
  }

  if (g->format != spec->vertexFormat) {
    return fail("VALIDATION_VERTEX_FORMAT_MISMATCH",
                "geometry vertex format does not match pipeline requirement",
                std::string(R"({"pipeline":")") + di.pipeline +
                  R"(","required":")" + toString(spec->vertexFormat) +
                  R"(","got":")" + toString(g->format) + R"("})");
  }

  if ((g->vertexCount % spec->verticesPerPrimitive) != 0u) {
    return fail("VALIDATION_BAD_VERTEX_COUNT",
                std::string(spec->key) + " requires vertexCount multiple of 3",
                std::string(R"({"vertexCount":)") + std::to_string(g->vertexCount) + "}");
  }

  return okResult();
}

// -------------------- query --------------------

std::string CommandProcessor::listResourcesJson() const {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);

  struct Section {
    const char* key;
    ResourceKind kind;
  };
  static const Section kSections[] = {
    {"panes", ResourceKind::Pane},
    {"layers", ResourceKind::Layer},
    {"drawItems", ResourceKind::DrawItem},
    {"buffers", ResourceKind::Buffer},
    {"geometries", ResourceKind::Geometry},
  };

  w.StartObject();
  for (const auto& s : kSections) {
    w.Key(s.key);
    w.StartArray();
    for (Id id : reg_.list(s.kind)) w.Uint64(id);
    w.EndArray();
  }

  w.EndObject();
  return sb.GetString();
}

} // namespace rs
