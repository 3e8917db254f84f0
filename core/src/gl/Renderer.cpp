#include "rs/gl/Renderer.hpp"
#include "rs/pipelines/PipelineCatalog.hpp"
#include <cstdio>
#include <string>

namespace rs {

namespace {

const char* kArcVert = R"GLSL(
#version 330 core
in vec2 a_pos;
void main() {
    gl_Position = vec4(a_pos, 0.0, 1.0);
}
)GLSL";

const char* kArcFrag = R"GLSL(
#version 330 core
out vec4 outColor;
uniform vec4 u_color;
void main() {
    outColor = u_color;
}
)GLSL";

std::string shaderLog(GLuint shader) {
  GLint len = 0;
  glGetShaderiv(shader, GL_INFO_LOG_LENGTH, &len);
  std::string log(static_cast<std::size_t>(len > 1 ? len : 1), '\0');
  glGetShaderInfoLog(shader, len, nullptr, &log[0]);
  return log;
}

std::string programLog(GLuint program) {
  GLint len = 0;
  glGetProgramiv(program, GL_INFO_LOG_LENGTH, &len);
  std::string log(static_cast<std::size_t>(len > 1 ? len : 1), '\0');
  glGetProgramInfoLog(program, len, nullptr, &log[0]);
  return log;
}

// 0 on failure; the compiler log goes to stderr.
GLuint compile(GLenum stage, const char* src) {
  GLuint shader = glCreateShader(stage);
  glShaderSource(shader, 1, &src, nullptr);
  glCompileShader(shader);
  GLint ok = GL_FALSE;
  glGetShaderiv(shader, GL_COMPILE_STATUS, &ok);
  if (ok == GL_TRUE) return shader;

  std::fprintf(stderr, "Renderer::init: %s shader: %s\n",
               stage == GL_VERTEX_SHADER ? "vertex" : "fragment", shaderLog(shader).c_str());
  glDeleteShader(shader);
  return 0;
}

GLuint link(GLuint vs, GLuint fs) {
  GLuint program = glCreateProgram();
  glAttachShader(program, vs);
  glAttachShader(program, fs);
  glLinkProgram(program);
  GLint ok = GL_FALSE;
  glGetProgramiv(program, GL_LINK_STATUS, &ok);
  if (ok == GL_TRUE) return program;

  std::fprintf(stderr, "Renderer::init: link: %s\n", programLog(program).c_str());
  glDeleteProgram(program);
  return 0;
}

} // namespace

Renderer::~Renderer() {
  if (vao_) glDeleteVertexArrays(1, &vao_);
  if (program_) glDeleteProgram(program_);
}

bool Renderer::init() {
  GLuint vs = compile(GL_VERTEX_SHADER, kArcVert);
  GLuint fs = vs ? compile(GL_FRAGMENT_SHADER, kArcFrag) : 0;
  if (vs && fs) program_ = link(vs, fs);
  if (vs) glDeleteShader(vs);
  if (fs) glDeleteShader(fs);
  if (!program_) return false;

  GLint pos = glGetAttribLocation(program_, "a_pos");
  if (pos < 0) {
    std::fprintf(stderr, "Renderer::init: a_pos not found\n");
    glDeleteProgram(program_);
    program_ = 0;
    return false;
  }
  aPos_ = static_cast<GLuint>(pos);
  uColor_ = glGetUniformLocation(program_, "u_color");

  glGenVertexArrays(1, &vao_);
  return true;
}

void Renderer::setClearColor(const float rgba[4]) {
  for (int i = 0; i < 4; ++i) clearColor_[i] = rgba[i];
}

bool Renderer::drawArc(const DrawItem& di, const Scene& scene, const GpuBufferManager& gpuBufs) {
  const Geometry* geo = scene.getGeometry(di.geometryId);
  if (!geo || geo->vertexCount == 0) return false;
  GLuint vbo = gpuBufs.vbo(geo->vertexBufferId);
  if (!vbo) return false;

  glUniform4f(uColor_, di.color[0], di.color[1], di.color[2], di.color[3]);
  glBindBuffer(GL_ARRAY_BUFFER, vbo);
  glVertexAttribPointer(aPos_, 2, GL_FLOAT, GL_FALSE, 0, nullptr);
  glDrawArrays(GL_TRIANGLES, 0, static_cast<GLsizei>(geo->vertexCount));
  return true;
}

Stats Renderer::render(const Scene& scene, GpuBufferManager& gpuBufs, int viewW, int viewH) {
  Stats stats{};
  if (!program_) return stats;

  glViewport(0, 0, viewW, viewH);
  glClearColor(clearColor_[0], clearColor_[1], clearColor_[2], clearColor_[3]);
  glClear(GL_COLOR_BUFFER_BIT);

  glEnable(GL_BLEND);
  glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
  glUseProgram(program_);
  glBindVertexArray(vao_);
  glEnableVertexAttribArray(aPos_);

  for (Id paneId : scene.paneIds()) {
    for (Id layerId : scene.layerIds()) {
      const Layer* layer = scene.getLayer(layerId);
      if (!layer || layer->paneId != paneId) continue;

      for (Id diId : scene.drawItemIds()) {
        const DrawItem* di = scene.getDrawItem(diId);
        if (!di || di->layerId != layerId) continue;

        // Fully faded arcs cost nothing.
        if (di->color[3] <= 0.0f || di->pipeline != kArcPipeline || !drawArc(*di, scene, gpuBufs)) {
          stats.skippedDrawItems++;
          continue;
        }
        stats.drawCalls++;
      }
    }
  }

  glDisableVertexAttribArray(aPos_);
  glBindBuffer(GL_ARRAY_BUFFER, 0);
  glBindVertexArray(0);
  glUseProgram(0);
  glDisable(GL_BLEND);
  glFlush();

  stats.activeBuffers = gpuBufs.bufferCount();
  return stats;
}

} // namespace rs
