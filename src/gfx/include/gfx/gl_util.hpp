#pragma once
#include <array>
#include <stdexcept>
#include <string>

#include <GLES3/gl3.h>

namespace vt::gfx {

// Thrown when a GL or EGL call fails.
class GlException : public std::runtime_error {
public:
    explicit GlException(const std::string& message) : std::runtime_error(message) {}
};

class IGraphicsContext;
using RenderTargetId = int;

namespace gl_util {

// Number of vertices in a rectangle drawn as a triangle strip.
inline constexpr int kRectangleVerticesCount = 4;

// Corners of the normalized device coordinate square, as vec4 triangle strip.
std::array<float, 16> normalized_coordinate_bounds();
// Corners of the texture coordinate square, as vec4 triangle strip.
std::array<float, 16> texture_coordinate_bounds();

// Throws GlException if glGetError() reports an error and GL error checks are
// enabled (VT_GL_ERROR_CHECKS). Drains every pending error flag.
void check_gl_error();
[[noreturn]] void throw_gl_exception(const std::string& message);

// Creates a GL_TEXTURE_2D with linear filtering and edge clamping. The texture
// stays bound to GL_TEXTURE_2D.
GLuint create_texture();
void delete_texture(GLuint texture_id);

// Makes the render target current on the context and sets the viewport to it.
void focus_render_target(IGraphicsContext& context, RenderTargetId target, int width, int height);

} // namespace gl_util
} // namespace vt::gfx
