#include "chroma/core/OctreeQuantizer.hh"

#include "chroma/core/Log.hh"
#include "chroma/utils/ErrorHandling.hh"
#include "chroma/utils/Profiler.hh"

#include <algorithm>
#include <limits>
#include <string>

namespace chroma {

OctreeQuantizer::OctreeQuantizer(int maxDepth, LookupStrategy lookup) : maxDepth_(maxDepth), lookup_(lookup) {
    if (maxDepth < 1 || maxDepth > kMaxOctreeDepth) {
        throwError(ErrorCode::InvalidConfiguration, "OctreeQuantizer: max depth must be in 1.." +
                                                        std::to_string(kMaxOctreeDepth) + ", got " +
                                                        std::to_string(maxDepth));
    }
    levels_.resize(static_cast<size_t>(maxDepth_));
    createNode(0);
}

OctreeQuantizer::OctreeQuantizer(const QuantizerConfig& config) : OctreeQuantizer(config.maxDepth, config.lookup) {}

NodeIndex OctreeQuantizer::createNode(int level) {
    auto index = static_cast<NodeIndex>(nodes_.size());
    nodes_.emplace_back(level);
    if (level < maxDepth_) {
        levels_[level].push_back(index);
    }
    return index;
}

void OctreeQuantizer::addColor(const Color& color) {
    if (paletteBuilt_) {
        throwError(ErrorCode::InvalidState, "OctreeQuantizer::addColor: palette already built");
    }

    NodeIndex current = kRoot;
    for (int level = 0; level < maxDepth_; ++level) {
        int branch = branchIndex(color, level);
        NodeIndex child = nodes_[current].children[branch];
        if (child == kNoNode) {
            // createNode can reallocate nodes_, so no reference is held across it
            child = createNode(level + 1);
            nodes_[current].children[branch] = child;
        }
        current = child;
    }
    nodes_[current].absorb(color);
    ++pixelCount_;
}

int OctreeQuantizer::reduceNode(NodeIndex index) {
    auto& node = nodes_[index];
    int folded = 0;
    for (NodeIndex child : node.children) {
        if (child != kNoNode) {
            node.fold(nodes_[child]);
            ++folded;
        }
    }
    return folded - 1;
}

std::vector<Color> OctreeQuantizer::makePalette(int colorCount) {
    CHROMA_ZONE_SCOPED;

    if (colorCount <= 0) {
        throwError(ErrorCode::InvalidConfiguration,
                   "OctreeQuantizer::makePalette: color count must be positive, got " + std::to_string(colorCount));
    }
    if (paletteBuilt_) {
        throwError(ErrorCode::InvalidState, "OctreeQuantizer::makePalette: palette already built");
    }

    std::vector<NodeIndex> leaves;
    collectLeaves(kRoot, leaves);
    const auto initialLeaves = static_cast<int64_t>(leaves.size());
    int64_t leafCount = initialLeaves;

    // Deepest level first. Within a level nodes are reduced in creation order
    // and the leaf count is checked after each reduction, so at least one node
    // is always reduced and the add order of colors decides which nodes
    // survive a partially reduced level.
    int stopLevel = maxDepth_;
    for (int level = maxDepth_ - 1; level >= 0 && !leaves.empty(); --level) {
        auto& registry = levels_[level];
        if (registry.empty())
            continue;
        for (NodeIndex index : registry) {
            leafCount -= reduceNode(index);
            if (leafCount <= colorCount)
                break;
        }
        stopLevel = level;
        if (leafCount <= colorCount)
            break;
        registry.clear();
    }

    leaves.clear();
    collectLeaves(kRoot, leaves);

    palette_.clear();
    palette_.reserve(std::min(leaves.size(), static_cast<size_t>(colorCount)));
    for (NodeIndex index : leaves) {
        if (palette_.size() >= static_cast<size_t>(colorCount))
            break;
        auto& node = nodes_[index];
        node.paletteIndex = static_cast<int>(palette_.size());
        palette_.push_back(node.averageColor());
    }
    paletteBuilt_ = true;

    if (leaves.empty()) {
        CHROMA_LOG_WARN("OctreeQuantizer::makePalette: no colors were added, palette is empty");
    } else if (leaves.size() > palette_.size()) {
        CHROMA_LOG_WARN("OctreeQuantizer::makePalette: {} leaves left without a palette slot",
                        leaves.size() - palette_.size());
    }
    CHROMA_LOG_DEBUG("Octree reduced {} -> {} leaves (stop level {}), palette {}/{} colors", initialLeaves,
                     leaves.size(), stopLevel, palette_.size(), colorCount);

    return palette_;
}

int OctreeQuantizer::paletteIndex(const Color& color) const {
    const auto& root = nodes_[kRoot];
    if (!root.isLeaf() && !root.hasChildren()) {
        throwError(ErrorCode::EmptyTree, "OctreeQuantizer::paletteIndex: no colors were added");
    }
    if (!paletteBuilt_) {
        throwError(ErrorCode::InvalidState, "OctreeQuantizer::paletteIndex: makePalette has not run");
    }

    if (lookup_ == LookupStrategy::Nearest) {
        return lookupNearest(color);
    }
    return lookupFirstBranch(color);
}

int OctreeQuantizer::lookupFirstBranch(const Color& color) const {
    NodeIndex current = kRoot;
    for (int level = 0;; ++level) {
        const auto& node = nodes_[current];
        if (node.isLeaf()) {
            if (node.paletteIndex == kNoPaletteIndex) {
                throwError(ErrorCode::InvalidState, "OctreeQuantizer::paletteIndex: leaf has no palette slot");
            }
            return node.paletteIndex;
        }

        NodeIndex next = node.children[branchIndex(color, level)];
        if (next == kNoNode) {
            // Path never seen while building: take the first child that exists
            for (NodeIndex child : node.children) {
                if (child != kNoNode) {
                    next = child;
                    break;
                }
            }
        }
        if (next == kNoNode) {
            throwError(ErrorCode::Internal,
                       "OctreeQuantizer::paletteIndex: interior node at level " + std::to_string(level) +
                           " has no children");
        }
        current = next;
    }
}

int OctreeQuantizer::lookupNearest(const Color& color) const {
    int best = 0;
    int bestDistance = std::numeric_limits<int>::max();
    for (size_t i = 0; i < palette_.size(); ++i) {
        int dr = static_cast<int>(palette_[i].red) - color.red;
        int dg = static_cast<int>(palette_[i].green) - color.green;
        int db = static_cast<int>(palette_[i].blue) - color.blue;
        int distance = dr * dr + dg * dg + db * db;
        if (distance < bestDistance) {
            bestDistance = distance;
            best = static_cast<int>(i);
        }
    }
    return best;
}

void OctreeQuantizer::collectLeaves(NodeIndex index, std::vector<NodeIndex>& out) const {
    const auto& node = nodes_[index];
    if (node.isLeaf()) {
        out.push_back(index);
        return;
    }
    for (NodeIndex child : node.children) {
        if (child != kNoNode) {
            collectLeaves(child, out);
        }
    }
}

int OctreeQuantizer::maxDepth() const {
    return maxDepth_;
}

LookupStrategy OctreeQuantizer::lookupStrategy() const {
    return lookup_;
}

size_t OctreeQuantizer::nodeCount() const {
    return nodes_.size();
}

size_t OctreeQuantizer::leafCount() const {
    std::vector<NodeIndex> leaves;
    collectLeaves(kRoot, leaves);
    return leaves.size();
}

uint64_t OctreeQuantizer::pixelCount() const {
    return pixelCount_;
}

bool OctreeQuantizer::isPaletteBuilt() const {
    return paletteBuilt_;
}

const std::vector<Color>& OctreeQuantizer::palette() const {
    return palette_;
}

} // namespace chroma
