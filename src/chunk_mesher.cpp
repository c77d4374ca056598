#include "chunk_mesher.h"

#include <array>
#include <stdexcept>

#include "height_map.h"
#include "voxel_block.h"

namespace {
enum Face { Front = 0, Back, Left, Right, Top, Bottom, FaceCount };

constexpr glm::vec3 normals[FaceCount] = {
    {0, 0, 1},
    {0, 0, -1},
    {-1, 0, 0},
    {1, 0, 0},
    {0, 1, 0},
    {0, -1, 0},
};

// Unit-cube corners per face, counter-clockwise seen from outside.
constexpr std::array<glm::vec3, 4> faceVertices[FaceCount] = {
    std::array<glm::vec3, 4>{glm::vec3(0, 0, 1), glm::vec3(1, 0, 1), glm::vec3(1, 1, 1), glm::vec3(0, 1, 1)}, // +Z (Front)
    std::array<glm::vec3, 4>{glm::vec3(1, 0, 0), glm::vec3(0, 0, 0), glm::vec3(0, 1, 0), glm::vec3(1, 1, 0)}, // -Z (Back)
    std::array<glm::vec3, 4>{glm::vec3(0, 0, 0), glm::vec3(0, 0, 1), glm::vec3(0, 1, 1), glm::vec3(0, 1, 0)}, // -X (Left)
    std::array<glm::vec3, 4>{glm::vec3(1, 0, 1), glm::vec3(1, 0, 0), glm::vec3(1, 1, 0), glm::vec3(1, 1, 1)}, // +X (Right)
    std::array<glm::vec3, 4>{glm::vec3(0, 1, 1), glm::vec3(1, 1, 1), glm::vec3(1, 1, 0), glm::vec3(0, 1, 0)}, // +Y (Top)
    std::array<glm::vec3, 4>{glm::vec3(0, 0, 0), glm::vec3(1, 0, 0), glm::vec3(1, 0, 1), glm::vec3(0, 0, 1)}, // -Y (Bottom)
};

constexpr std::array<int, 6> quadTriangles = {0, 1, 2, 2, 3, 0};

void addQuad(ChunkSurface& surface,
             const glm::vec3& base,
             const glm::vec3& scale,
             Face face,
             const glm::vec3& color) {
    const std::array<glm::vec3, 4>& corners = faceVertices[face];
    for (int corner : quadTriangles) {
        surface.positions.push_back(base + corners[static_cast<std::size_t>(corner)] * scale);
        surface.normals.push_back(normals[face]);
        surface.colors.push_back(color);
    }
}
} // namespace

std::optional<ChunkSurface> meshChunk(const HeightMap& heightMap,
                                      ChunkCoord coord,
                                      const BlockRegistry& registry,
                                      const ChunkMeshSettings& settings) {
    if (settings.chunkSize <= 0) {
        throw std::invalid_argument("meshChunk: chunk size must be positive");
    }

    const int size = settings.chunkSize;
    const float voxel = settings.voxelSize;
    const glm::vec3 scale(voxel);

    ChunkSurface surface;
    surface.reserve(static_cast<std::size_t>(size) * static_cast<std::size_t>(size) * 30u);

    // World coordinates in 64 bits: chunk keys span the whole int range.
    const long long world = heightMap.size();
    const long long originX = static_cast<long long>(coord.x) * size;
    const long long originZ = static_cast<long long>(coord.z) * size;

    for (int z = 0; z < size; ++z) {
        for (int x = 0; x < size; ++x) {
            const long long worldX = originX + x;
            const long long worldZ = originZ + z;
            int height = heightMap.at(static_cast<int>(worldX % world), static_cast<int>(worldZ % world));

            for (int y = 0; y < height; ++y) {
                glm::vec3 base = glm::vec3(static_cast<float>(worldX), static_cast<float>(y), static_cast<float>(worldZ)) * voxel;
                glm::vec3 color = registry.color(tierForDepth(y, height));

                addQuad(surface, base, scale, Top, color);

                if (y == height - 1) {
                    glm::vec3 shaded = color * settings.sideShade;
                    addQuad(surface, base, scale, Front, shaded);
                    addQuad(surface, base, scale, Back, shaded);
                    addQuad(surface, base, scale, Left, shaded);
                    addQuad(surface, base, scale, Right, shaded);
                }
            }
        }
    }

    if (surface.empty()) {
        return std::nullopt;
    }
    return surface;
}

ChunkSurface cuboidSurface(const glm::vec3& minCorner,
                           const glm::vec3& extent,
                           const glm::vec3& color,
                           float sideShade) {
    ChunkSurface surface;
    surface.reserve(6u * FaceCount);
    addQuad(surface, minCorner, extent, Top, color);
    addQuad(surface, minCorner, extent, Bottom, color * sideShade);
    for (Face face : {Front, Back, Left, Right}) {
        addQuad(surface, minCorner, extent, face, color * sideShade);
    }
    return surface;
}
