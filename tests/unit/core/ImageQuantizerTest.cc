#include <gtest/gtest.h>

#include "chroma/core/ImageQuantizer.hh"

#include <cstdint>
#include <vector>

using namespace chroma;

namespace {

QuantizerConfig paletteOf(int size) {
    QuantizerConfig config;
    config.paletteSize = size;
    return config;
}

// 16x16 RGB gradient: red along x, green along y, constant blue
std::vector<uint8_t> makeGradient() {
    std::vector<uint8_t> pixels;
    pixels.reserve(16 * 16 * 3);
    for (int y = 0; y < 16; ++y) {
        for (int x = 0; x < 16; ++x) {
            pixels.push_back(static_cast<uint8_t>(x * 16));
            pixels.push_back(static_cast<uint8_t>(y * 16));
            pixels.push_back(64);
        }
    }
    return pixels;
}

} // namespace

TEST(ImageQuantizerTest, RgbaKeepsAlphaAndMergesNearColors) {
    std::vector<uint8_t> pixels = {
        0,   0,   0,   10, // black
        1,   1,   1,   20, // near black
        255, 255, 255, 30, // white
        254, 254, 254, 40, // near white
    };
    ImageQuantizer quantizer(paletteOf(2));

    auto result = quantizer.quantize(pixels, 2, 2, 4);
    ASSERT_TRUE(result.isOk()) << result.message();
    const auto& image = result.value();

    EXPECT_EQ(image.width, 2);
    EXPECT_EQ(image.height, 2);
    EXPECT_EQ(image.channels, 4);
    ASSERT_EQ(image.palette.size(), 2u);
    EXPECT_EQ(image.indices, (std::vector<uint16_t>{0, 0, 1, 1}));

    std::vector<uint8_t> expected = {
        0, 0, 0, 10, 0, 0, 0, 20, 254, 254, 254, 30, 254, 254, 254, 40,
    };
    EXPECT_EQ(image.pixels, expected);
}

TEST(ImageQuantizerTest, OutputPixelsComeFromPalette) {
    auto pixels = makeGradient();
    ImageQuantizer quantizer(paletteOf(8));

    auto result = quantizer.quantize(pixels, 16, 16, 3);
    ASSERT_TRUE(result.isOk()) << result.message();
    const auto& image = result.value();

    ASSERT_GT(image.palette.size(), 0u);
    ASSERT_LE(image.palette.size(), 8u);
    ASSERT_EQ(image.indices.size(), 256u);
    ASSERT_EQ(image.pixels.size(), pixels.size());

    for (size_t i = 0; i < image.indices.size(); ++i) {
        ASSERT_LT(image.indices[i], image.palette.size());
        const Color& c = image.palette[image.indices[i]];
        EXPECT_EQ(image.pixels[i * 3], c.red);
        EXPECT_EQ(image.pixels[i * 3 + 1], c.green);
        EXPECT_EQ(image.pixels[i * 3 + 2], c.blue);
    }
}

TEST(ImageQuantizerTest, FewColorsAreReproducedExactly) {
    auto pixels = makeGradient();
    ImageQuantizer quantizer(paletteOf(256));

    auto result = quantizer.quantize(pixels, 16, 16, 3);
    ASSERT_TRUE(result.isOk()) << result.message();
    EXPECT_EQ(result.value().palette.size(), 256u);
    EXPECT_EQ(result.value().pixels, pixels);
}

TEST(ImageQuantizerTest, RejectsBufferSizeMismatch) {
    std::vector<uint8_t> pixels(2 * 2 * 3 - 1, 0);
    ImageQuantizer quantizer;

    auto result = quantizer.quantize(pixels, 2, 2, 3);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.code(), ErrorCode::BufferOverrun);
}

TEST(ImageQuantizerTest, RejectsBadShape) {
    std::vector<uint8_t> pixels(8, 0);
    ImageQuantizer quantizer;

    EXPECT_EQ(quantizer.quantize(pixels, 2, 2, 2).code(), ErrorCode::InvalidConfiguration);
    EXPECT_EQ(quantizer.quantize(pixels, 0, 2, 4).code(), ErrorCode::InvalidConfiguration);
    EXPECT_EQ(quantizer.quantize(pixels, 2, -1, 4).code(), ErrorCode::InvalidConfiguration);
}

TEST(ImageQuantizerTest, RejectsInvalidConfig) {
    std::vector<uint8_t> pixels(3, 0);

    EXPECT_EQ(ImageQuantizer(paletteOf(0)).quantize(pixels, 1, 1, 3).code(), ErrorCode::InvalidConfiguration);

    QuantizerConfig deep;
    deep.maxDepth = 12;
    EXPECT_EQ(ImageQuantizer(deep).quantize(pixels, 1, 1, 3).code(), ErrorCode::InvalidConfiguration);

    EXPECT_EQ(ImageQuantizer(paletteOf(ImageQuantizer::kMaxPaletteSize + 1)).quantize(pixels, 1, 1, 3).code(),
              ErrorCode::InvalidConfiguration);
}

TEST(ImageQuantizerTest, NearestLookupStillUsesPaletteColors) {
    auto pixels = makeGradient();
    QuantizerConfig config = paletteOf(4);
    config.lookup = LookupStrategy::Nearest;

    auto result = ImageQuantizer(config).quantize(pixels, 16, 16, 3);
    ASSERT_TRUE(result.isOk()) << result.message();
    const auto& image = result.value();
    for (size_t i = 0; i < image.indices.size(); ++i) {
        const Color& c = image.palette[image.indices[i]];
        EXPECT_EQ(image.pixels[i * 3], c.red);
    }
}
