#ifdef RS_HAS_GLFW

#include "rs/gl/GlfwContext.hpp"
#include <glad/gl.h>
#include <GLFW/glfw3.h>
#include <cmath>
#include <cstdio>

namespace rs {

namespace {

GlfwContext* self(GLFWwindow* w) {
  return static_cast<GlfwContext*>(glfwGetWindowUserPointer(w));
}

} // namespace

GlfwContext::~GlfwContext() {
  if (window_) glfwDestroyWindow(window_);
  glfwTerminate();
}

bool GlfwContext::init(int width, int height) {
  if (!glfwInit()) {
    std::fprintf(stderr, "GlfwContext: glfwInit failed\n");
    return false;
  }

  glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
  glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
  glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
  glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);
  glfwWindowHint(GLFW_RESIZABLE, GLFW_FALSE);

  window_ = glfwCreateWindow(width, height, "RotaryScrollbar", nullptr, nullptr);
  if (!window_) {
    std::fprintf(stderr, "GlfwContext: glfwCreateWindow failed\n");
    glfwTerminate();
    return false;
  }

  glfwMakeContextCurrent(window_);
  glfwSwapInterval(1);

  if (!gladLoadGL((GLADloadfunc)glfwGetProcAddress)) {
    std::fprintf(stderr, "GlfwContext: gladLoadGL failed\n");
    glfwDestroyWindow(window_);
    window_ = nullptr;
    glfwTerminate();
    return false;
  }

  glfwGetFramebufferSize(window_, &width_, &height_);

  glfwSetWindowUserPointer(window_, this);
  glfwSetScrollCallback(window_, scrollCallback);
  glfwSetCursorPosCallback(window_, cursorPosCallback);
  glfwSetMouseButtonCallback(window_, mouseButtonCallback);
  glfwSetKeyCallback(window_, keyCallback);

  double x = 0;
  glfwGetCursorPos(window_, &x, &lastCursorY_);
  return true;
}

void GlfwContext::swapBuffers() {
  if (window_) glfwSwapBuffers(window_);
}

std::vector<std::uint8_t> GlfwContext::readPixels() const {
  std::vector<std::uint8_t> pixels(static_cast<std::size_t>(width_) * height_ * 4);
  glReadPixels(0, 0, width_, height_, GL_RGBA, GL_UNSIGNED_BYTE, pixels.data());
  return pixels;
}

bool GlfwContext::shouldClose() const {
  return window_ && glfwWindowShouldClose(window_);
}

WindowInput GlfwContext::pollInput() {
  glfwPollEvents();
  if (window_) glfwGetFramebufferSize(window_, &width_, &height_);

  WindowInput in;
  in.shouldClose = shouldClose();
  in.dragging = dragging_;
  in.dragDy = dragDy_;
  in.togglePaged = togglePaged_;

  // Whole detents only; trackpads deliver fractions that add up.
  double whole = std::trunc(wheelAccum_);
  in.wheelTicks = static_cast<int>(whole);
  wheelAccum_ -= whole;

  dragDy_ = 0;
  togglePaged_ = false;
  return in;
}

void GlfwContext::scrollCallback(GLFWwindow* w, double /*xoff*/, double yoff) {
  // Wheel up scrolls back, like turning a crown counter-clockwise.
  if (auto* s = self(w)) s->wheelAccum_ -= yoff;
}

void GlfwContext::cursorPosCallback(GLFWwindow* w, double /*x*/, double y) {
  auto* s = self(w);
  if (!s) return;
  if (s->dragging_) s->dragDy_ += s->lastCursorY_ - y;
  s->lastCursorY_ = y;
}

void GlfwContext::mouseButtonCallback(GLFWwindow* w, int button, int action, int /*mods*/) {
  auto* s = self(w);
  if (s && button == GLFW_MOUSE_BUTTON_LEFT) s->dragging_ = (action == GLFW_PRESS);
}

void GlfwContext::keyCallback(GLFWwindow* w, int key, int /*scancode*/, int action, int /*mods*/) {
  auto* s = self(w);
  if (!s || action != GLFW_PRESS) return;
  if (key == GLFW_KEY_P) s->togglePaged_ = true;
  if (key == GLFW_KEY_ESCAPE) glfwSetWindowShouldClose(w, GLFW_TRUE);
}

} // namespace rs

#endif // RS_HAS_GLFW
