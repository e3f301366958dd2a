#include "gfx/gl_program.hpp"
#include "core/log.hpp"

#include <algorithm>

namespace vt::gfx {

namespace {

std::string shader_info_log(GLuint shader) {
    GLint length = 0;
    glGetShaderiv(shader, GL_INFO_LOG_LENGTH, &length);
    std::string log(static_cast<size_t>(std::max(length, 1)), '\0');
    GLsizei written = 0;
    glGetShaderInfoLog(shader, static_cast<GLsizei>(log.size()), &written, log.data());
    log.resize(static_cast<size_t>(written));
    return log;
}

std::string program_info_log(GLuint program) {
    GLint length = 0;
    glGetProgramiv(program, GL_INFO_LOG_LENGTH, &length);
    std::string log(static_cast<size_t>(std::max(length, 1)), '\0');
    GLsizei written = 0;
    glGetProgramInfoLog(program, static_cast<GLsizei>(log.size()), &written, log.data());
    log.resize(static_cast<size_t>(written));
    return log;
}

// Array uniforms are reported as "name[0]".
std::string strip_array_suffix(std::string name) {
    auto pos = name.find('[');
    if(pos != std::string::npos) name.resize(pos);
    return name;
}

} // namespace

GlProgram::GlProgram(const char* vertex_shader_glsl, const char* fragment_shader_glsl) {
    program_ = glCreateProgram();
    gl_util::check_gl_error();

    add_shader(program_, GL_VERTEX_SHADER, vertex_shader_glsl);
    add_shader(program_, GL_FRAGMENT_SHADER, fragment_shader_glsl);

    glLinkProgram(program_);
    GLint linked = GL_FALSE;
    glGetProgramiv(program_, GL_LINK_STATUS, &linked);
    if(linked != GL_TRUE) {
        std::string log = program_info_log(program_);
        glDeleteProgram(program_);
        program_ = 0;
        gl_util::throw_gl_exception("Unable to link shader program: \n" + log);
    }
    glUseProgram(program_);

    GLint max_name = 0;
    GLint count = 0;
    glGetProgramiv(program_, GL_ACTIVE_ATTRIBUTE_MAX_LENGTH, &max_name);
    glGetProgramiv(program_, GL_ACTIVE_ATTRIBUTES, &count);
    std::vector<char> name_bytes(static_cast<size_t>(std::max(max_name, 1)));
    for(GLint i = 0; i < count; ++i) {
        GLsizei length = 0;
        GLint size = 0;
        GLenum type = 0;
        glGetActiveAttrib(program_, static_cast<GLuint>(i), static_cast<GLsizei>(name_bytes.size()),
                          &length, &size, &type, name_bytes.data());
        Attribute attr;
        attr.name.assign(name_bytes.data(), static_cast<size_t>(length));
        attr.location = glGetAttribLocation(program_, attr.name.c_str());
        attribute_by_name_[attr.name] = attributes_.size();
        attributes_.push_back(std::move(attr));
    }

    glGetProgramiv(program_, GL_ACTIVE_UNIFORM_MAX_LENGTH, &max_name);
    glGetProgramiv(program_, GL_ACTIVE_UNIFORMS, &count);
    name_bytes.assign(static_cast<size_t>(std::max(max_name, 1)), '\0');
    for(GLint i = 0; i < count; ++i) {
        GLsizei length = 0;
        GLint size = 0;
        GLenum type = 0;
        glGetActiveUniform(program_, static_cast<GLuint>(i), static_cast<GLsizei>(name_bytes.size()),
                           &length, &size, &type, name_bytes.data());
        Uniform uni;
        uni.name = strip_array_suffix(std::string(name_bytes.data(), static_cast<size_t>(length)));
        uni.location = glGetUniformLocation(program_, uni.name.c_str());
        uni.type = type;
        uniform_by_name_[uni.name] = uniforms_.size();
        uniforms_.push_back(std::move(uni));
    }
    gl_util::check_gl_error();
    vt::log::debug("GlProgram " + std::to_string(program_) + " linked: attributes=" +
                   std::to_string(attributes_.size()) + " uniforms=" + std::to_string(uniforms_.size()));
}

GlProgram::~GlProgram() {
    if(program_ != 0) {
        glDeleteProgram(program_);
    }
}

void GlProgram::add_shader(GLuint program, GLenum type, const char* glsl) {
    GLuint shader = glCreateShader(type);
    glShaderSource(shader, 1, &glsl, nullptr);
    glCompileShader(shader);

    GLint compiled = GL_FALSE;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &compiled);
    if(compiled != GL_TRUE) {
        std::string log = shader_info_log(shader);
        glDeleteShader(shader);
        gl_util::throw_gl_exception(log + ", source: " + glsl);
    }

    glAttachShader(program, shader);
    glDeleteShader(shader);
    gl_util::check_gl_error();
}

void GlProgram::use() {
    glUseProgram(program_);
    gl_util::check_gl_error();
}

void GlProgram::release() {
    if(program_ == 0) return;
    glDeleteProgram(program_);
    program_ = 0;
    gl_util::check_gl_error();
}

GlProgram::Attribute& GlProgram::attribute(const std::string& name) {
    auto it = attribute_by_name_.find(name);
    if(it == attribute_by_name_.end()) gl_util::throw_gl_exception("No active attribute " + name);
    return attributes_[it->second];
}

GlProgram::Uniform& GlProgram::uniform(const std::string& name) {
    auto it = uniform_by_name_.find(name);
    if(it == uniform_by_name_.end()) gl_util::throw_gl_exception("No active uniform " + name);
    return uniforms_[it->second];
}

void GlProgram::set_buffer_attribute(const std::string& name, const float* values, size_t count, int size) {
    Attribute& attr = attribute(name);
    attr.buffer.assign(values, values + count);
    attr.size = size;
}

void GlProgram::set_sampler_tex_id_uniform(const std::string& name, GLuint texture_id, int unit) {
    Uniform& uni = uniform(name);
    uni.texture_id = texture_id;
    uni.texture_unit = unit;
}

void GlProgram::set_floats_uniform(const std::string& name, const float* values, size_t count) {
    Uniform& uni = uniform(name);
    std::copy(values, values + std::min(count, uni.value.size()), uni.value.begin());
}

void GlProgram::bind_attributes_and_uniforms() {
    for(const auto& attr : attributes_) attr.bind();
    for(const auto& uni : uniforms_) uni.bind();
}

void GlProgram::Attribute::bind() const {
    if(buffer.empty() || location < 0) {
        gl_util::throw_gl_exception("Attribute " + name + " has no buffer set");
    }
    glBindBuffer(GL_ARRAY_BUFFER, 0);
    glVertexAttribPointer(static_cast<GLuint>(location), size, GL_FLOAT, GL_FALSE, 0, buffer.data());
    glEnableVertexAttribArray(static_cast<GLuint>(location));
    gl_util::check_gl_error();
}

void GlProgram::Uniform::bind() const {
    switch(type) {
        case GL_FLOAT: glUniform1fv(location, 1, value.data()); break;
        case GL_FLOAT_VEC2: glUniform2fv(location, 1, value.data()); break;
        case GL_FLOAT_VEC3: glUniform3fv(location, 1, value.data()); break;
        case GL_FLOAT_VEC4: glUniform4fv(location, 1, value.data()); break;
        case GL_FLOAT_MAT3: glUniformMatrix3fv(location, 1, GL_FALSE, value.data()); break;
        case GL_FLOAT_MAT4: glUniformMatrix4fv(location, 1, GL_FALSE, value.data()); break;
        case GL_SAMPLER_2D:
            if(texture_id == 0) gl_util::throw_gl_exception("No texture bound for sampler " + name);
            glActiveTexture(static_cast<GLenum>(GL_TEXTURE0 + texture_unit));
            glBindTexture(GL_TEXTURE_2D, texture_id);
            glUniform1i(location, texture_unit);
            break;
        default:
            gl_util::throw_gl_exception("Unexpected uniform type for " + name + ": " + std::to_string(type));
    }
    gl_util::check_gl_error();
}

} // namespace vt::gfx
