#pragma once

#include "chroma/core/OctreeNode.hh"
#include "chroma/utils/ErrorHandling.hh"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace chroma {

// How GetPaletteIndex resolves a color whose exact path is missing from the
// reduced tree.
enum class LookupStrategy : uint8_t {
    FirstBranch, // descend into the first existing child (default)
    Nearest      // smallest squared RGB distance over the palette
};

std::string_view lookupStrategyToString(LookupStrategy strategy);
std::optional<LookupStrategy> parseLookupStrategy(std::string_view name);

struct QuantizerConfig {
    static constexpr int kDefaultPaletteSize = 16;

    int maxDepth = kMaxOctreeDepth;
    int paletteSize = kDefaultPaletteSize;
    LookupStrategy lookup = LookupStrategy::FirstBranch;
    std::string logLevel = "info";

    // InvalidConfiguration when maxDepth is outside 1..8, paletteSize is not
    // positive, or logLevel is not a known level name.
    Result<void> validate() const;

    // Push logLevel to the root logger. Unknown names are ignored.
    void applyLogLevel() const;
};

} // namespace chroma
