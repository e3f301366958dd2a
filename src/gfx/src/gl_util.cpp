#include "gfx/gl_util.hpp"
#include "gfx/graphics_context.hpp"
#include "core/config.hpp"
#include "core/log.hpp"

#include <sstream>

namespace vt::gfx::gl_util {

std::array<float, 16> normalized_coordinate_bounds() {
    return {-1, -1, 0, 1,
             1, -1, 0, 1,
            -1,  1, 0, 1,
             1,  1, 0, 1};
}

std::array<float, 16> texture_coordinate_bounds() {
    return {0, 0, 0, 1,
            1, 0, 0, 1,
            0, 1, 0, 1,
            1, 1, 0, 1};
}

void throw_gl_exception(const std::string& message) {
    vt::log::error("GL_ERROR: " + message);
    throw GlException(message);
}

void check_gl_error() {
    if(!vt::config().gl_error_checks) return;
    bool found = false;
    std::ostringstream oss;
    GLenum error;
    while((error = glGetError()) != GL_NO_ERROR) {
        oss << (found ? ", " : "glError: 0x") << std::hex << error;
        found = true;
    }
    if(found) throw_gl_exception(oss.str());
}

GLuint create_texture() {
    GLuint texture_id = 0;
    glGenTextures(1, &texture_id);
    check_gl_error();
    glBindTexture(GL_TEXTURE_2D, texture_id);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
    check_gl_error();
    return texture_id;
}

void delete_texture(GLuint texture_id) {
    glDeleteTextures(1, &texture_id);
    check_gl_error();
}

void focus_render_target(IGraphicsContext& context, RenderTargetId target, int width, int height) {
    context.make_current(target);
    glViewport(0, 0, width, height);
    check_gl_error();
}

} // namespace vt::gfx::gl_util
