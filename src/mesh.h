#pragma once

#include <cstddef>
#include <vector>

#include <glm/glm.hpp>

struct RenderVertex {
    glm::vec3 pos;
    glm::vec3 normal;
    glm::vec3 color;
};

inline constexpr std::size_t kRenderVertexStride = sizeof(RenderVertex);

inline constexpr int kPositionLocation = 0;
inline constexpr int kNormalLocation = 1;
inline constexpr int kColorLocation = 2;

// Non-indexed triangle soup: every three consecutive entries form one
// triangle. The three arrays always have the same length.
struct ChunkSurface {
    std::vector<glm::vec3> positions;
    std::vector<glm::vec3> normals;
    std::vector<glm::vec3> colors;

    std::size_t vertexCount() const { return positions.size(); }
    std::size_t triangleCount() const { return positions.size() / 3; }
    bool empty() const { return positions.empty(); }

    void reserve(std::size_t vertices) {
        positions.reserve(vertices);
        normals.reserve(vertices);
        colors.reserve(vertices);
    }

    std::vector<RenderVertex> interleaved() const {
        std::vector<RenderVertex> out;
        out.reserve(positions.size());
        for (std::size_t i = 0; i < positions.size(); ++i) {
            out.push_back(RenderVertex{positions[i], normals[i], colors[i]});
        }
        return out;
    }
};
