#pragma once

#include <cstdint>
#include <optional>

namespace chroma {

// 8-bit RGB color. Alpha is carried for callers that need it; the quantizer
// only reads red, green and blue.
struct Color {
    uint8_t red = 0;
    uint8_t green = 0;
    uint8_t blue = 0;
    std::optional<uint8_t> alpha;

    constexpr Color() = default;
    constexpr Color(uint8_t r, uint8_t g, uint8_t b) : red(r), green(g), blue(b) {}
    constexpr Color(uint8_t r, uint8_t g, uint8_t b, uint8_t a) : red(r), green(g), blue(b), alpha(a) {}

    bool operator==(const Color&) const = default;
};

} // namespace chroma
