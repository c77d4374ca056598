#include "terrain_program.h"

#include <fstream>
#include <iostream>
#include <iterator>

#include <glad/glad.h>
#include <glm/gtc/type_ptr.hpp>

#include "mesh.h"

namespace {
struct AttributeSlot {
    int location;
    const char* name;
};

// Must agree with the layout qualifiers in terrain.vert.
constexpr AttributeSlot kAttributes[] = {
    {kPositionLocation, "aPos"},
    {kNormalLocation, "aNormal"},
    {kColorLocation, "aColor"},
};

std::string infoLog(GLuint object, bool isProgram) {
    GLint length = 0;
    if (isProgram) {
        glGetProgramiv(object, GL_INFO_LOG_LENGTH, &length);
    } else {
        glGetShaderiv(object, GL_INFO_LOG_LENGTH, &length);
    }
    if (length <= 1) {
        return "(no log)";
    }
    std::string log(static_cast<std::size_t>(length), '\0');
    if (isProgram) {
        glGetProgramInfoLog(object, length, nullptr, &log[0]);
    } else {
        glGetShaderInfoLog(object, length, nullptr, &log[0]);
    }
    return log;
}
} // namespace

TerrainProgram::~TerrainProgram() {
    if (program_ != 0) {
        glDeleteProgram(program_);
    }
}

bool TerrainProgram::build(const std::filesystem::path& shaderDir) {
    const std::filesystem::path vertexPath = shaderDir / "terrain.vert";
    const std::filesystem::path fragmentPath = shaderDir / "terrain.frag";

    std::string vertexSource;
    std::string fragmentSource;
    if (!readSource(vertexPath, vertexSource) || !readSource(fragmentPath, fragmentSource)) {
        return false;
    }

    GLuint vertex = compileStage(GL_VERTEX_SHADER, vertexSource, vertexPath);
    if (vertex == 0) {
        return false;
    }
    GLuint fragment = compileStage(GL_FRAGMENT_SHADER, fragmentSource, fragmentPath);
    if (fragment == 0) {
        glDeleteShader(vertex);
        return false;
    }

    bool linked = linkStages(vertex, fragment);
    glDeleteShader(vertex);
    glDeleteShader(fragment);
    return linked;
}

void TerrainProgram::bind() const {
    glUseProgram(program_);
}

void TerrainProgram::setViewProjection(const glm::mat4& viewProj) const {
    glUniformMatrix4fv(uniforms_.viewProj, 1, GL_FALSE, glm::value_ptr(viewProj));
}

void TerrainProgram::setLighting(const glm::vec3& sunDir, float ambient, float diffuse) const {
    glm::vec3 dir = glm::normalize(sunDir);
    glUniform3fv(uniforms_.sunDir, 1, glm::value_ptr(dir));
    glUniform1f(uniforms_.ambient, ambient);
    glUniform1f(uniforms_.diffuse, diffuse);
}

void TerrainProgram::setModel(const glm::mat4& model) const {
    glUniformMatrix4fv(uniforms_.model, 1, GL_FALSE, glm::value_ptr(model));
}

bool TerrainProgram::readSource(const std::filesystem::path& path, std::string& source) {
    std::ifstream file(path);
    if (!file) {
        std::cerr << "[TerrainProgram] Cannot open " << path.string() << std::endl;
        return false;
    }
    source.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    if (source.empty()) {
        std::cerr << "[TerrainProgram] Empty shader source " << path.string() << std::endl;
        return false;
    }
    return true;
}

unsigned int TerrainProgram::compileStage(unsigned int stage, const std::string& source, const std::filesystem::path& origin) {
    GLuint shader = glCreateShader(stage);
    const char* text = source.c_str();
    glShaderSource(shader, 1, &text, nullptr);
    glCompileShader(shader);

    GLint compiled = GL_FALSE;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &compiled);
    if (compiled != GL_TRUE) {
        std::cerr << "[TerrainProgram] " << origin.filename().string() << ": " << infoLog(shader, false) << std::endl;
        glDeleteShader(shader);
        return 0;
    }
    return shader;
}

bool TerrainProgram::linkStages(unsigned int vertex, unsigned int fragment) {
    GLuint program = glCreateProgram();
    glAttachShader(program, vertex);
    glAttachShader(program, fragment);
    glLinkProgram(program);

    GLint linked = GL_FALSE;
    glGetProgramiv(program, GL_LINK_STATUS, &linked);
    if (linked != GL_TRUE) {
        std::cerr << "[TerrainProgram] Link failed: " << infoLog(program, true) << std::endl;
        glDeleteProgram(program);
        return false;
    }

    // Chunk buffers are laid out for the mesh.h slots.
    for (const AttributeSlot& slot : kAttributes) {
        GLint location = glGetAttribLocation(program, slot.name);
        if (location != slot.location) {
            std::cerr << "[TerrainProgram] " << slot.name << " bound to slot " << location
                      << ", vertex buffers expect " << slot.location << std::endl;
            glDeleteProgram(program);
            return false;
        }
    }

    if (program_ != 0) {
        glDeleteProgram(program_);
    }
    program_ = program;
    uniforms_.viewProj = glGetUniformLocation(program_, "uViewProj");
    uniforms_.model = glGetUniformLocation(program_, "uModel");
    uniforms_.sunDir = glGetUniformLocation(program_, "uSunDir");
    uniforms_.ambient = glGetUniformLocation(program_, "uAmbient");
    uniforms_.diffuse = glGetUniformLocation(program_, "uDiffuse");
    return true;
}
