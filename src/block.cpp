#include "voxel_block.h"

namespace {
constexpr glm::vec3 fromHex(uint32_t hex) {
    return glm::vec3(static_cast<float>((hex >> 16) & 0xFF) / 255.0f,
                     static_cast<float>((hex >> 8) & 0xFF) / 255.0f,
                     static_cast<float>(hex & 0xFF) / 255.0f);
}
} // namespace

BlockId tierForDepth(int y, int height) {
    if (y == height - 1) {
        return BlockId::Grass;
    }
    if (y > height - 4) {
        return BlockId::Dirt;
    }
    return BlockId::Stone;
}

BlockRegistry::BlockRegistry() {
    for (auto& block : blocks_) {
        block = BlockInfo{};
    }

    BlockInfo& grass = slot(BlockId::Grass);
    grass.solid = true;
    grass.name = "Grass";
    grass.tint = fromHex(0x3a7d3a);

    BlockInfo& dirt = slot(BlockId::Dirt);
    dirt.solid = true;
    dirt.name = "Dirt";
    dirt.tint = fromHex(0x8b7355);

    BlockInfo& stone = slot(BlockId::Stone);
    stone.solid = true;
    stone.name = "Stone";
    stone.tint = fromHex(0x808080);
}
