// Round scrollbar demo
// GLFW: mouse wheel acts as the rotary crown, drag scrolls, P toggles a pager.
// OSMesa fallback: renders one frame mid-list and writes round_scrollbar.ppm

#include "rs/commands/CommandProcessor.hpp"
#include "rs/export/FrameSnapshot.hpp"
#include "rs/gl/GpuBufferManager.hpp"
#include "rs/gl/Renderer.hpp"
#include "rs/recipe/RoundScrollbarRecipe.hpp"
#include "rs/render/SceneArcPainter.hpp"
#include "rs/rotary/RotaryEventSource.hpp"
#include "rs/scene/ResourceRegistry.hpp"
#include "rs/scene/Scene.hpp"
#include "rs/scroll/PageModel.hpp"
#include "rs/scroll/ScrollModel.hpp"
#include "rs/scrollbar/RoundScrollbar.hpp"
#include "rs/timing/FrameScheduler.hpp"

#ifdef RS_HAS_GLFW
#include "rs/gl/GlfwContext.hpp"
#endif
#ifdef RS_HAS_OSMESA
#include "rs/gl/OsMesaContext.hpp"
#endif

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <memory>

static void requireOk(const rs::CmdResult& r, const char* ctx) {
  if (!r.ok) {
    std::fprintf(stderr, "FAIL [%s]: code=%s msg=%s\n",
                 ctx, r.err.code.c_str(), r.err.message.c_str());
    std::exit(1);
  }
}

// Logs haptic pulses instead of driving a motor.
struct ConsoleHaptics : rs::HapticActuator {
  void vibrate(int durationMs, int amplitude) override {
    std::printf("haptic %dms @%d\n", durationMs, amplitude);
  }
};

static void uploadDirty(rs::SceneArcPainter& painter, rs::GpuBufferManager& gpu) {
  for (rs::Id id : painter.takeDirtyBuffers()) gpu.setVertices(id, painter.vertexData(id));
  gpu.uploadDirty();
}

int main() {
  constexpr int W = 454;
  constexpr int H = 454;

  // ---- Scene ----
  rs::Scene scene;
  rs::ResourceRegistry reg;
  rs::CommandProcessor cp(scene, reg);
  requireOk(cp.applyJsonText(R"({"cmd":"createPane","id":1,"name":"Watch"})"), "pane");
  requireOk(cp.applyJsonText(R"({"cmd":"createLayer","id":2,"paneId":1,"name":"Overlay"})"), "layer");

  rs::RoundScrollbarRecipeConfig rcfg;
  rcfg.paneId = 1;
  rcfg.layerId = 2;
  rcfg.name = "scrollbar";
  rs::RoundScrollbarRecipe recipe(100, rcfg);
  for (const auto& cmd : recipe.build().createCommands) requireOk(cp.applyJsonText(cmd), "recipe");

  // ---- Scroll sources ----
  rs::FrameScheduler sched;
  rs::ScrollModel list(sched, H, 12.0 * H);
  rs::PageModel pager(sched, 5, W);
  rs::QueuedRotaryEventSource rotary;
  ConsoleHaptics haptics;

  bool paged = false;
  auto makeBar = [&]() -> std::unique_ptr<rs::RoundScrollbar> {
    if (paged) {
      return std::make_unique<rs::RoundScrollbar>(sched, pager, rs::RoundScrollbarConfig{},
                                                  &rotary, &haptics);
    }
    return std::make_unique<rs::RoundScrollbar>(sched, list, rs::RoundScrollbarConfig{},
                                                &rotary, &haptics);
  };
  std::unique_ptr<rs::RoundScrollbar> bar = makeBar();

  const float background[4] = {0.0f, 0.0f, 0.0f, 1.0f};

#ifdef RS_HAS_GLFW
  {
    rs::GlfwContext ctx;
    if (ctx.init(W, H)) {
      rs::GpuBufferManager gpu;
      rs::Renderer renderer;
      if (!renderer.init()) {
        std::fprintf(stderr, "Renderer init failed\n");
        return 1;
      }
      renderer.setClearColor(background);
      rs::SceneArcPainter painter(cp, recipe, ctx.width(), ctx.height());

      std::printf("Wheel = rotary crown, drag = touch scroll, P = toggle pager, Esc = quit\n");

      auto last = std::chrono::steady_clock::now();
      for (;;) {
        rs::WindowInput in = ctx.pollInput();
        if (in.shouldClose) break;

        if (in.togglePaged) {
          paged = !paged;
          bar.reset();
          bar = makeBar();
          std::printf("source: %s\n", paged ? "pager" : "list");
        }

        for (int i = 0; i < in.wheelTicks; ++i) {
          rotary.push(rs::RotaryEvent{rs::RotaryDirection::Clockwise});
        }
        for (int i = 0; i > in.wheelTicks; --i) {
          rotary.push(rs::RotaryEvent{rs::RotaryDirection::CounterClockwise});
        }

        if (in.dragDy != 0.0) {
          if (paged) pager.jumpToPage(pager.page() + in.dragDy / pager.viewportExtent());
          else list.jumpTo(list.offset() + in.dragDy);
        }
        // A released drag settles on the nearest page.
        if (paged && !in.dragging && !pager.isAnimating() &&
            bar->tracker().clampPosition(pager.page()) != pager.page()) {
          pager.animateToPage(static_cast<int>(bar->tracker().clampPosition(pager.page())),
                              rs::MotionSpec{250.0, rs::Curve::EaseInOutCirc}, {});
        }

        rotary.dispatchPending();

        auto now = std::chrono::steady_clock::now();
        sched.advance(std::chrono::duration<double, std::milli>(now - last).count());
        last = now;

        painter.setViewSize(ctx.width(), ctx.height());
        bar->paint(painter);
        uploadDirty(painter, gpu);
        renderer.render(scene, gpu, ctx.width(), ctx.height());
        ctx.swapBuffers();
      }
      return 0;
    }
    std::fprintf(stderr, "GLFW unavailable, falling back to OSMesa\n");
  }
#endif

#ifdef RS_HAS_OSMESA
  {
    rs::OsMesaContext ctx;
    if (!ctx.init(W, H)) {
      std::fprintf(stderr, "OSMesa init failed\n");
      return 1;
    }
    rs::GpuBufferManager gpu;
    rs::Renderer renderer;
    if (!renderer.init()) {
      std::fprintf(stderr, "Renderer init failed\n");
      return 1;
    }
    renderer.setClearColor(background);
    rs::SceneArcPainter painter(cp, recipe, W, H);

    // Three crown detents, then let the scroll and fade settle.
    for (int i = 0; i < 3; ++i) rotary.push(rs::RotaryEvent{rs::RotaryDirection::Clockwise});
    rotary.dispatchPending();
    sched.advance(300.0);

    bar->paint(painter);
    uploadDirty(painter, gpu);
    rs::Stats st = renderer.render(scene, gpu, W, H);
    ctx.swapBuffers();
    std::printf("offset=%.1f drawCalls=%u\n", list.offset(), st.drawCalls);

    auto pixels = ctx.readPixels();
    if (!rs::writePPMFlipped("round_scrollbar.ppm", pixels.data(), W, H)) {
      std::fprintf(stderr, "Failed to write round_scrollbar.ppm\n");
      return 1;
    }
    std::printf("Wrote round_scrollbar.ppm\n");
    return 0;
  }
#endif

  std::fprintf(stderr, "No GL context available\n");
  return 1;
}
