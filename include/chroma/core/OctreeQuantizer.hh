#pragma once

#include "chroma/core/Color.hh"
#include "chroma/core/OctreeNode.hh"
#include "chroma/core/QuantizerConfig.hh"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace chroma {

// Octree color quantizer. Use in three strictly ordered phases:
//   1. addColor() for every input color
//   2. makePalette() exactly once; reduces the tree in place
//   3. paletteIndex() for any color
// Phase violations throw ChromaException. Not thread-safe. Logs through
// chroma::log; without an explicit log::init() a console logger is created on
// the first message.
//
// Nodes live in an arena (nodes_) and refer to children by index. levels_[d]
// lists every node created at depth d in creation order; reduction walks it
// deepest level first. Nodes at maxDepth are always leaves and are not listed.
class OctreeQuantizer {
  public:
    explicit OctreeQuantizer(int maxDepth = kMaxOctreeDepth, LookupStrategy lookup = LookupStrategy::FirstBranch);
    explicit OctreeQuantizer(const QuantizerConfig& config);

    void addColor(const Color& color);

    // Reduce to at most `colorCount` leaves and return their average colors.
    // Because a reduction folds up to 8 leaves at once, the palette can hold
    // up to 7 fewer entries than requested.
    std::vector<Color> makePalette(int colorCount);

    int paletteIndex(const Color& color) const;

    int maxDepth() const;
    LookupStrategy lookupStrategy() const;
    size_t nodeCount() const;
    size_t leafCount() const;
    uint64_t pixelCount() const;
    bool isPaletteBuilt() const;
    const std::vector<Color>& palette() const;

  private:
    static constexpr NodeIndex kRoot = 0;

    NodeIndex createNode(int level);

    // Fold every child of `index` into it. Returns the change in leaf count
    // (children folded - 1).
    int reduceNode(NodeIndex index);

    void collectLeaves(NodeIndex index, std::vector<NodeIndex>& out) const;
    int lookupFirstBranch(const Color& color) const;
    int lookupNearest(const Color& color) const;

    int maxDepth_;
    LookupStrategy lookup_;
    std::vector<OctreeNode> nodes_;
    std::vector<std::vector<NodeIndex>> levels_;
    std::vector<Color> palette_;
    uint64_t pixelCount_ = 0;
    bool paletteBuilt_ = false;
};

} // namespace chroma
