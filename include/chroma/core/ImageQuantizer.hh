#pragma once

#include "chroma/core/Color.hh"
#include "chroma/core/QuantizerConfig.hh"
#include "chroma/utils/ErrorHandling.hh"

#include <cstdint>
#include <span>
#include <vector>

namespace chroma {

struct QuantizedImage {
    int width = 0;
    int height = 0;
    int channels = 0;
    std::vector<uint8_t> pixels;  // same layout as the input, RGB replaced
    std::vector<Color> palette;
    std::vector<uint16_t> indices; // one palette index per pixel, row-major
};

// Runs an OctreeQuantizer over an interleaved 8-bit RGB (3 channels) or RGBA
// (4 channels) buffer. Alpha bytes are copied through untouched. Logging
// needs no setup; see OctreeQuantizer.
class ImageQuantizer {
  public:
    static constexpr int kMaxPaletteSize = 65536;

    explicit ImageQuantizer(QuantizerConfig config = {});

    Result<QuantizedImage> quantize(std::span<const uint8_t> pixels, int width, int height, int channels) const;

    const QuantizerConfig& config() const;

  private:
    QuantizerConfig config_;
};

} // namespace chroma
