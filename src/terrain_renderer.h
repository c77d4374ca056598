#pragma once

#include <unordered_map>
#include <vector>

#include <glad/glad.h>
#include <glm/glm.hpp>

#include "chunk.h"
#include "mesh.h"

class TerrainProgram;
class ChunkManager;
struct PlayerState;

// GL side of the chunk table: one vertex buffer per meshed chunk, plus the
// player avatar box.
class TerrainRenderer {
public:
    TerrainRenderer(float playerRadius, float playerHeight);
    ~TerrainRenderer();

    TerrainRenderer(const TerrainRenderer&) = delete;
    TerrainRenderer& operator=(const TerrainRenderer&) = delete;

    // Uploads the listed chunks and releases buffers of chunks that are no
    // longer present in the manager.
    void sync(const ChunkManager& chunks, const std::vector<ChunkCoord>& created);

    void render(const TerrainProgram& program) const;
    void renderPlayer(const TerrainProgram& program, const PlayerState& player) const;

    int uploadedCount() const { return static_cast<int>(buffers_.size()); }
    std::size_t vertexCount() const { return vertexCount_; }

private:
    struct MeshBuffers {
        GLuint vao = 0;
        GLuint vbo = 0;
        GLsizei vertexCount = 0;
    };

    static void upload(const std::vector<RenderVertex>& vertices, MeshBuffers& dst);
    static void destroy(MeshBuffers& mesh);

    std::unordered_map<ChunkCoord, MeshBuffers> buffers_;
    MeshBuffers player_{};
    std::size_t vertexCount_ = 0;
};
