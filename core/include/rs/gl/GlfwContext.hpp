#pragma once
#include "rs/gl/GlContext.hpp"

#ifdef RS_HAS_GLFW

struct GLFWwindow;

namespace rs {

// Input gathered since the previous pollInput().
struct WindowInput {
  double dragDy{0};        // pixels, positive = content moves up
  int wheelTicks{0};       // signed detents, positive = wheel down
  bool togglePaged{false}; // 'P'
  bool dragging{false};
  bool shouldClose{false};
};

// Desktop window; the mouse wheel stands in for a rotary crown.
class GlfwContext : public GlContext {
public:
  GlfwContext() = default;
  ~GlfwContext() override;

  GlfwContext(const GlfwContext&) = delete;
  GlfwContext& operator=(const GlfwContext&) = delete;

  bool init(int width, int height) override;
  void swapBuffers() override;

  int width() const override { return width_; }
  int height() const override { return height_; }

  std::vector<std::uint8_t> readPixels() const override;

  WindowInput pollInput();
  bool shouldClose() const;

private:
  GLFWwindow* window_{nullptr};
  int width_{0};
  int height_{0};

  // Accumulated by callbacks
  double wheelAccum_{0};
  double lastCursorY_{0};
  double dragDy_{0};
  bool dragging_{false};
  bool togglePaged_{false};

  static void scrollCallback(GLFWwindow* w, double xoff, double yoff);
  static void cursorPosCallback(GLFWwindow* w, double x, double y);
  static void mouseButtonCallback(GLFWwindow* w, int button, int action, int mods);
  static void keyCallback(GLFWwindow* w, int key, int scancode, int action, int mods);
};

} // namespace rs

#endif // RS_HAS_GLFW
