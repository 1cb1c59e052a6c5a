#include "chroma/core/OctreeNode.hh"

#include "chroma/utils/ErrorHandling.hh"

#include <algorithm>
#include <string>

namespace chroma {

bool OctreeNode::hasChildren() const {
    return std::any_of(children.begin(), children.end(), [](NodeIndex child) { return child != kNoNode; });
}

void OctreeNode::absorb(const Color& color) {
    redSum += color.red;
    greenSum += color.green;
    blueSum += color.blue;
    ++pixelCount;
}

void OctreeNode::fold(const OctreeNode& other) {
    redSum += other.redSum;
    greenSum += other.greenSum;
    blueSum += other.blueSum;
    pixelCount += other.pixelCount;
}

Color OctreeNode::averageColor() const {
    if (pixelCount == 0) {
        throwError(ErrorCode::EmptyLeaf,
                   "OctreeNode::averageColor: node at level " + std::to_string(level) + " holds no pixels");
    }
    return Color(static_cast<uint8_t>(redSum / pixelCount), static_cast<uint8_t>(greenSum / pixelCount),
                 static_cast<uint8_t>(blueSum / pixelCount));
}

} // namespace chroma
