#include "chroma/core/QuantizerConfig.hh"

#include "chroma/core/Log.hh"

#include <string>

namespace chroma {

std::string_view lookupStrategyToString(LookupStrategy strategy) {
    switch (strategy) {
        case LookupStrategy::FirstBranch:
            return "first_branch";
        case LookupStrategy::Nearest:
            return "nearest";
    }
    return "unknown";
}

std::optional<LookupStrategy> parseLookupStrategy(std::string_view name) {
    if (name == "first_branch")
        return LookupStrategy::FirstBranch;
    if (name == "nearest")
        return LookupStrategy::Nearest;
    return std::nullopt;
}

Result<void> QuantizerConfig::validate() const {
    if (maxDepth < 1 || maxDepth > kMaxOctreeDepth) {
        return Result<void>::error(ErrorCode::InvalidConfiguration,
                                   "max_depth must be in 1.." + std::to_string(kMaxOctreeDepth) + ", got " +
                                       std::to_string(maxDepth));
    }
    if (paletteSize <= 0) {
        return Result<void>::error(ErrorCode::InvalidConfiguration,
                                   "palette_size must be positive, got " + std::to_string(paletteSize));
    }
    if (!log::parseLevel(logLevel)) {
        return Result<void>::error(ErrorCode::InvalidConfiguration, "unknown log level '" + logLevel + "'");
    }
    return Result<void>::ok();
}

void QuantizerConfig::applyLogLevel() const {
    if (auto level = log::parseLevel(logLevel)) {
        log::setLevel(*level);
    }
}

} // namespace chroma
