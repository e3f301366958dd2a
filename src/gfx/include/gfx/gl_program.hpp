#pragma once
#include <array>
#include <string>
#include <unordered_map>
#include <vector>

#include "gfx/gl_util.hpp"

namespace vt::gfx {

// A compiled and linked GLSL program with its active attributes and uniforms.
// Values are staged with the set_* calls and uploaded by
// bind_attributes_and_uniforms(). Must be created, used and deleted with the
// owning GL context current.
class GlProgram {
public:
    // Throws GlException if compiling or linking fails.
    GlProgram(const char* vertex_shader_glsl, const char* fragment_shader_glsl);
    ~GlProgram();

    GlProgram(const GlProgram&) = delete;
    GlProgram& operator=(const GlProgram&) = delete;

    void use();
    // Deletes the program. Deleted programs cannot be used again.
    void release();

    void set_buffer_attribute(const std::string& name, const float* values, size_t count, int size);
    void set_sampler_tex_id_uniform(const std::string& name, GLuint texture_id, int unit);
    void set_floats_uniform(const std::string& name, const float* values, size_t count);

    void bind_attributes_and_uniforms();

private:
    struct Attribute {
        std::string name;
        GLint location = -1;
        std::vector<float> buffer;
        int size = 0;
        void bind() const;
    };

    struct Uniform {
        std::string name;
        GLint location = -1;
        GLenum type = 0;
        std::array<float, 16> value{};
        GLuint texture_id = 0;
        int texture_unit = 0;
        void bind() const;
    };

    static void add_shader(GLuint program, GLenum type, const char* glsl);
    Attribute& attribute(const std::string& name);
    Uniform& uniform(const std::string& name);

    GLuint program_ = 0;
    std::vector<Attribute> attributes_;
    std::vector<Uniform> uniforms_;
    std::unordered_map<std::string, size_t> attribute_by_name_;
    std::unordered_map<std::string, size_t> uniform_by_name_;
};

} // namespace vt::gfx
