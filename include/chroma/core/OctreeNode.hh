#pragma once

#include "chroma/core/Color.hh"

#include <array>
#include <cstdint>

namespace chroma {

using NodeIndex = int32_t;

inline constexpr NodeIndex kNoNode = -1;
inline constexpr int kOctreeArity = 8;
inline constexpr int kMaxOctreeDepth = 8; // one level per bit of an 8-bit channel
inline constexpr int kNoPaletteIndex = -1;

// Child slot for `color` at `level`: bit (7 - level) of red, green and blue
// packed as r<<2 | g<<1 | b.
constexpr int branchIndex(const Color& color, int level) {
    const int shift = 7 - level;
    return (((color.red >> shift) & 1) << 2) | (((color.green >> shift) & 1) << 1) | ((color.blue >> shift) & 1);
}

// A node in the quantizer's arena. Children are arena indices, kNoNode when
// the slot is empty. A node is a leaf once it holds pixels, either because it
// sits at the maximum depth or because its children were folded into it.
struct OctreeNode {
    int level = 0;
    uint64_t redSum = 0;
    uint64_t greenSum = 0;
    uint64_t blueSum = 0;
    uint64_t pixelCount = 0;
    int paletteIndex = kNoPaletteIndex;
    std::array<NodeIndex, kOctreeArity> children{kNoNode, kNoNode, kNoNode, kNoNode,
                                                 kNoNode, kNoNode, kNoNode, kNoNode};

    OctreeNode() = default;
    explicit OctreeNode(int nodeLevel) : level(nodeLevel) {}

    bool isLeaf() const { return pixelCount > 0; }
    bool hasChildren() const;

    // Accumulate one raw color.
    void absorb(const Color& color);

    // Add another node's sums and pixel count into this one.
    void fold(const OctreeNode& other);

    // Per-channel floor average of everything absorbed. Throws EmptyLeaf when
    // the node holds no pixels.
    Color averageColor() const;
};

} // namespace chroma
