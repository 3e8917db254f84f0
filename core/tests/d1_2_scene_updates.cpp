// D1.2: per-frame update commands and draw ordering

#include "rs/scene/Scene.hpp"
#include "rs/scene/ResourceRegistry.hpp"
#include "rs/commands/CommandProcessor.hpp"

#include <cstdio>
#include <cstdlib>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static void requireOk(const rs::CmdResult& r, const char* ctx) {
  if (!r.ok) {
    std::fprintf(stderr, "FAIL [%s]: code=%s msg=%s\n",
                 ctx, r.err.code.c_str(), r.err.message.c_str());
    std::exit(1);
  }
}

int main() {
  rs::Scene scene;
  rs::ResourceRegistry reg;
  rs::CommandProcessor cp(scene, reg);

  requireOk(cp.applyJsonText(R"({"cmd":"createPane","id":1})"), "pane");
  requireOk(cp.applyJsonText(R"({"cmd":"createLayer","id":10,"paneId":1})"), "layer");
  requireOk(cp.applyJsonText(R"({"cmd":"createBuffer","id":100,"byteLength":0})"), "buffer");
  requireOk(cp.applyJsonText(
    R"({"cmd":"createGeometry","id":101,"vertexBufferId":100,"format":"pos2_clip","vertexCount":0})"),
    "geometry");
  requireOk(cp.applyJsonText(R"({"cmd":"createDrawItem","id":103,"layerId":10,"name":"b"})"), "di b");
  requireOk(cp.applyJsonText(R"({"cmd":"createDrawItem","id":102,"layerId":10,"name":"a"})"), "di a");
  requireOk(cp.applyJsonText(
    R"({"cmd":"bindDrawItem","drawItemId":102,"pipeline":"triSolid@1","geometryId":101})"), "bind");

  // ---- Test 1: enumeration is ascending ----
  {
    auto ids = scene.drawItemIds();
    requireTrue(ids.size() == 2 && ids[0] == 102 && ids[1] == 103, "sorted draw items");
    std::printf("  Test 1 (ordering): PASS\n");
  }

  // ---- Test 2: setDrawItemColor ----
  {
    requireOk(cp.applyJsonText(
      R"({"cmd":"setDrawItemColor","drawItemId":102,"r":0.25,"g":0.5,"b":0.75,"a":0.3})"), "color");
    const rs::DrawItem* di = scene.getDrawItem(102);
    requireTrue(di->color[0] == 0.25f && di->color[3] == 0.3f, "color applied");

    auto r = cp.applyJsonText(
      R"({"cmd":"setDrawItemColor","drawItemId":102,"r":1.5,"g":0,"b":0,"a":1})");
    requireTrue(!r.ok, "out of range rejected");
    requireTrue(di->color[0] == 0.25f, "rejected color leaves item unchanged");

    auto missing = cp.applyJsonText(R"({"cmd":"setDrawItemColor","drawItemId":999,"r":0,"g":0,"b":0,"a":0})");
    requireTrue(!missing.ok && missing.err.code == "MISSING_DRAWITEM", "missing item");
    std::printf("  Test 2 (color): PASS\n");
  }

  // ---- Test 3: setGeometryVertexCount ----
  {
    requireOk(cp.applyJsonText(R"({"cmd":"setGeometryVertexCount","geometryId":101,"vertexCount":96})"),
              "vertexCount");
    requireTrue(scene.getGeometry(101)->vertexCount == 96, "count applied");

    auto r = cp.applyJsonText(R"({"cmd":"setGeometryVertexCount","geometryId":101,"vertexCount":4})");
    requireTrue(!r.ok && r.err.code == "VALIDATION_BAD_VERTEX_COUNT", "non-triangle count rejected");
    requireTrue(scene.getGeometry(101)->vertexCount == 96, "count unchanged");
    std::printf("  Test 3 (vertexCount): PASS\n");
  }

  // ---- Test 4: byte length ----
  {
    requireOk(cp.applyJsonText(R"({"cmd":"setBufferByteLength","bufferId":100,"byteLength":768})"), "len");
    requireTrue(scene.getBuffer(100)->byteLength == 768, "byteLength");
    std::printf("  Test 4 (byteLength): PASS\n");
  }

  // ---- Test 5: bind validation ----
  {
    auto r = cp.applyJsonText(
      R"({"cmd":"bindDrawItem","drawItemId":103,"pipeline":"instancedRect@1","geometryId":101})");
    requireTrue(!r.ok && r.err.code == "UNKNOWN_PIPELINE", "unknown pipeline");
    auto taken = cp.applyJsonText(R"({"cmd":"createBuffer","id":100,"byteLength":0})");
    requireTrue(!taken.ok && taken.err.code == "ID_TAKEN", "id taken");
    std::printf("  Test 5 (validation): PASS\n");
  }

  std::printf("D1.2 scene updates: ALL PASS\n");
  return 0;
}
