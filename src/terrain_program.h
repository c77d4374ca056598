#pragma once

#include <filesystem>
#include <string>

#include <glm/glm.hpp>

// The GL program that draws the vertex-colored terrain and the player box.
// Attribute slots come from mesh.h; uniform locations are looked up once
// after linking.
class TerrainProgram {
public:
    TerrainProgram() = default;
    ~TerrainProgram();

    TerrainProgram(const TerrainProgram&) = delete;
    TerrainProgram& operator=(const TerrainProgram&) = delete;

    // Reads terrain.vert and terrain.frag from `shaderDir`. Logs and
    // returns false if a stage fails to read, compile or link.
    bool build(const std::filesystem::path& shaderDir);
    bool ready() const { return program_ != 0; }

    void bind() const;
    void setViewProjection(const glm::mat4& viewProj) const;
    void setLighting(const glm::vec3& sunDir, float ambient, float diffuse) const;
    void setModel(const glm::mat4& model) const;

private:
    struct Uniforms {
        int viewProj = -1;
        int model = -1;
        int sunDir = -1;
        int ambient = -1;
        int diffuse = -1;
    };

    static bool readSource(const std::filesystem::path& path, std::string& source);
    static unsigned int compileStage(unsigned int stage, const std::string& source, const std::filesystem::path& origin);
    bool linkStages(unsigned int vertex, unsigned int fragment);

    unsigned int program_ = 0;
    Uniforms uniforms_;
};
