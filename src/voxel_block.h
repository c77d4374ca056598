#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

#include <glm/glm.hpp>

enum class BlockId : uint8_t {
    Air = 0,
    Grass,
    Dirt,
    Stone,
    Count
};

struct BlockInfo {
    bool solid = false;
    std::string name = "Air";
    glm::vec3 tint{1.0f};
};

// Tier of the voxel at height y inside a column whose surface is at
// height (exclusive): topmost voxel is grass, the three below it dirt,
// everything deeper stone.
BlockId tierForDepth(int y, int height);

class BlockRegistry {
public:
    BlockRegistry();

    const BlockInfo& info(BlockId id) const { return blocks_[static_cast<std::size_t>(id)]; }
    glm::vec3 color(BlockId id) const { return info(id).tint; }

private:
    BlockInfo& slot(BlockId id) { return blocks_[static_cast<std::size_t>(id)]; }
    std::array<BlockInfo, static_cast<int>(BlockId::Count)> blocks_;
};
