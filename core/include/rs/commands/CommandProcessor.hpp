#pragma once
#include "rs/ids/Id.hpp"
#include "rs/scene/ResourceRegistry.hpp"
#include "rs/scene/Scene.hpp"

#include <string>

#include <rapidjson/document.h>

namespace rs {

struct CmdError {
  std::string code;     // e.g. "VALIDATION_MISSING_GEOMETRY"
  std::string message;  // human text
  std::string details;  // small JSON object
};

struct CmdResult {
  bool ok{true};
  CmdError err{};
  Id createdId{0};
};

// Applies JSON scene commands ({"cmd":"createPane",...}) to a Scene.
// Errors are returned, never thrown.
class CommandProcessor {
public:
  CommandProcessor(Scene& scene, ResourceRegistry& registry);

  CmdResult applyJson(const rapidjson::Value& obj);
  CmdResult applyJsonText(const std::string& jsonText);

  // {"panes":[...],"layers":[...],"drawItems":[...],"buffers":[...],"geometries":[...]}
  std::string listResourcesJson() const;

private:
  Scene& scene_;
  ResourceRegistry& reg_;

  // ---- handlers ----
  CmdResult cmdCreatePane(const rapidjson::Value& obj);
  CmdResult cmdCreateLayer(const rapidjson::Value& obj);
  CmdResult cmdCreateDrawItem(const rapidjson::Value& obj);
  CmdResult cmdDelete(const rapidjson::Value& obj);

  CmdResult cmdCreateBuffer(const rapidjson::Value& obj);
  CmdResult cmdCreateGeometry(const rapidjson::Value& obj);
  CmdResult cmdBindDrawItem(const rapidjson::Value& obj);

  CmdResult cmdSetDrawItemColor(const rapidjson::Value& obj);
  CmdResult cmdSetGeometryVertexCount(const rapidjson::Value& obj);
  CmdResult cmdSetBufferByteLength(const rapidjson::Value& obj);

  // helpers
  static const rapidjson::Value* getMember(const rapidjson::Value& obj, const char* key);
  static std::string getStringOrEmpty(const rapidjson::Value& obj, const char* key);
  static Id getIdOrZero(const rapidjson::Value& obj, const char* key);
  static CmdResult fail(const std::string& code,
                        const std::string& message,
                        const std::string& detailsJson = "{}");
  static CmdResult okResult(Id createdId = 0);

  // Reserves obj["id"] or allocates one. Fails with ID_TAKEN.
  CmdResult claimId(const rapidjson::Value& obj, ResourceKind kind, const char* cmdName);

  CmdResult validateDrawItem(const DrawItem& di) const;
};

} // namespace rs
