#include "terrain_renderer.h"

#include <cstddef>

#include <glm/gtc/matrix_transform.hpp>

#include "chunk_manager.h"
#include "chunk_mesher.h"
#include "player.h"
#include "terrain_program.h"

namespace {
const glm::vec3 kPlayerColor(1.0f, 0.0f, 0.0f);
}

TerrainRenderer::TerrainRenderer(float playerRadius, float playerHeight) {
    // Avatar box centered on the player position.
    glm::vec3 extent(playerRadius * 2.0f, playerHeight, playerRadius * 2.0f);
    ChunkSurface box = cuboidSurface(-extent * 0.5f, extent, kPlayerColor, 0.8f);
    upload(box.interleaved(), player_);
}

TerrainRenderer::~TerrainRenderer() {
    for (auto& [coord, mesh] : buffers_) {
        destroy(mesh);
    }
    destroy(player_);
}

void TerrainRenderer::sync(const ChunkManager& chunks, const std::vector<ChunkCoord>& created) {
    for (auto it = buffers_.begin(); it != buffers_.end();) {
        if (!chunks.contains(it->first)) {
            vertexCount_ -= static_cast<std::size_t>(it->second.vertexCount);
            destroy(it->second);
            it = buffers_.erase(it);
        } else {
            ++it;
        }
    }

    for (const ChunkCoord& coord : created) {
        const Chunk* chunk = chunks.find(coord);
        if (!chunk || chunk->empty()) {
            continue;
        }
        MeshBuffers& mesh = buffers_[coord];
        vertexCount_ -= static_cast<std::size_t>(mesh.vertexCount);
        upload(chunk->surface()->interleaved(), mesh);
        vertexCount_ += static_cast<std::size_t>(mesh.vertexCount);
    }
}

void TerrainRenderer::render(const TerrainProgram& program) const {
    program.setModel(glm::mat4(1.0f));
    for (const auto& [coord, mesh] : buffers_) {
        if (mesh.vertexCount == 0) {
            continue;
        }
        glBindVertexArray(mesh.vao);
        glDrawArrays(GL_TRIANGLES, 0, mesh.vertexCount);
    }
    glBindVertexArray(0);
}

void TerrainRenderer::renderPlayer(const TerrainProgram& program, const PlayerState& player) const {
    glm::mat4 model = glm::translate(glm::mat4(1.0f), player.position);
    model = glm::rotate(model, player.heading, glm::vec3(0.0f, 1.0f, 0.0f));
    program.setModel(model);
    glBindVertexArray(player_.vao);
    glDrawArrays(GL_TRIANGLES, 0, player_.vertexCount);
    glBindVertexArray(0);
}

void TerrainRenderer::upload(const std::vector<RenderVertex>& vertices, MeshBuffers& dst) {
    if (!dst.vao) {
        glGenVertexArrays(1, &dst.vao);
        glGenBuffers(1, &dst.vbo);
    }

    glBindVertexArray(dst.vao);
    glBindBuffer(GL_ARRAY_BUFFER, dst.vbo);
    glBufferData(GL_ARRAY_BUFFER,
                 static_cast<GLsizeiptr>(vertices.size() * sizeof(RenderVertex)),
                 vertices.data(),
                 GL_STATIC_DRAW);

    glEnableVertexAttribArray(kPositionLocation);
    glVertexAttribPointer(kPositionLocation, 3, GL_FLOAT, GL_FALSE, static_cast<GLsizei>(kRenderVertexStride), reinterpret_cast<void*>(offsetof(RenderVertex, pos)));
    glEnableVertexAttribArray(kNormalLocation);
    glVertexAttribPointer(kNormalLocation, 3, GL_FLOAT, GL_FALSE, static_cast<GLsizei>(kRenderVertexStride), reinterpret_cast<void*>(offsetof(RenderVertex, normal)));
    glEnableVertexAttribArray(kColorLocation);
    glVertexAttribPointer(kColorLocation, 3, GL_FLOAT, GL_FALSE, static_cast<GLsizei>(kRenderVertexStride), reinterpret_cast<void*>(offsetof(RenderVertex, color)));
    glBindVertexArray(0);

    dst.vertexCount = static_cast<GLsizei>(vertices.size());
}

void TerrainRenderer::destroy(MeshBuffers& mesh) {
    if (mesh.vao) {
        glDeleteVertexArrays(1, &mesh.vao);
        glDeleteBuffers(1, &mesh.vbo);
        mesh = {};
    }
}
