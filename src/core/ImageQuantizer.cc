#include "chroma/core/ImageQuantizer.hh"

#include "chroma/core/Log.hh"
#include "chroma/core/OctreeQuantizer.hh"
#include "chroma/utils/Profiler.hh"

#include <string>
#include <utility>

namespace chroma {

ImageQuantizer::ImageQuantizer(QuantizerConfig config) : config_(std::move(config)) {}

Result<QuantizedImage> ImageQuantizer::quantize(std::span<const uint8_t> pixels, int width, int height,
                                                int channels) const {
    CHROMA_ZONE_SCOPED;

    auto valid = config_.validate();
    if (valid.isError()) {
        return Result<QuantizedImage>::error(valid.code(), valid.message());
    }
    if (config_.paletteSize > kMaxPaletteSize) {
        return Result<QuantizedImage>::error(ErrorCode::InvalidConfiguration,
                                             "palette_size exceeds " + std::to_string(kMaxPaletteSize));
    }
    if (width <= 0 || height <= 0) {
        return Result<QuantizedImage>::error(ErrorCode::InvalidConfiguration,
                                             "image dimensions must be positive, got " + std::to_string(width) + "x" +
                                                 std::to_string(height));
    }
    if (channels != 3 && channels != 4) {
        return Result<QuantizedImage>::error(ErrorCode::InvalidConfiguration,
                                             "expected 3 or 4 channels, got " + std::to_string(channels));
    }

    const size_t pixelCount = static_cast<size_t>(width) * static_cast<size_t>(height);
    const size_t expected = pixelCount * static_cast<size_t>(channels);
    if (pixels.size() != expected) {
        return Result<QuantizedImage>::error(ErrorCode::BufferOverrun, "pixel buffer holds " +
                                                                           std::to_string(pixels.size()) +
                                                                           " bytes, expected " +
                                                                           std::to_string(expected));
    }

    OctreeQuantizer octree(config_);
    for (size_t i = 0; i < expected; i += static_cast<size_t>(channels)) {
        octree.addColor(Color(pixels[i], pixels[i + 1], pixels[i + 2]));
    }

    QuantizedImage image;
    image.width = width;
    image.height = height;
    image.channels = channels;
    image.palette = octree.makePalette(config_.paletteSize);
    image.pixels.assign(pixels.begin(), pixels.end());
    image.indices.reserve(pixelCount);

    for (size_t i = 0; i < expected; i += static_cast<size_t>(channels)) {
        int index = octree.paletteIndex(Color(pixels[i], pixels[i + 1], pixels[i + 2]));
        const Color& mapped = image.palette[static_cast<size_t>(index)];
        image.pixels[i] = mapped.red;
        image.pixels[i + 1] = mapped.green;
        image.pixels[i + 2] = mapped.blue;
        image.indices.push_back(static_cast<uint16_t>(index));
    }

    CHROMA_LOG_DEBUG("Quantized {}x{} image ({} channels) to {} colors", width, height, channels,
                     image.palette.size());
    return Result<QuantizedImage>::ok(std::move(image));
}

const QuantizerConfig& ImageQuantizer::config() const {
    return config_;
}

} // namespace chroma
