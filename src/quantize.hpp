#pragma once

// Reduces a full color RGBA frame to a palette of at most 256 colors and one
// palette index per pixel.
//
// This is deliberately simple: colors are bucketed by their top five bits per
// channel, the most frequent buckets become the palette and every pixel is
// mapped to its nearest palette entry. No median cut, no dithering.

#include "common.hpp"

#include <array>
#include <span>
#include <vector>

namespace flipbook::gif {

using std::array;

struct Palette {
    // the palette holds exactly 1 << bit_depth colors, 1 <= bit_depth <= 8
    int bit_depth = 1;

    array<u8, 256> r{};
    array<u8, 256> g{};
    array<u8, 256> b{};

    [[nodiscard]] constexpr auto size() const -> usize {
        return usize{1} << bit_depth;
    }

    // index of the entry closest to (red, green, blue) by squared euclidean
    // distance, the lowest index wins ties
    [[nodiscard]] auto closest(int red, int green, int blue) const -> u8;

    // append the color table bytes (r, g, b per entry, in index order)
    void write(std::vector<u8> &out) const;

    friend auto operator==(Palette const &, Palette const &) -> bool = default;
};

struct QuantizedFrame {
    Palette palette;
    std::vector<u8> indices; // one per pixel, row-major, < palette.size()
};

constexpr usize max_palette_colors = 256;

// mask applied to each channel before counting, keeps five bits
constexpr u8 coarse_mask = 0xf8;

// Builds the palette and the indexed buffer for one frame of RGBA pixels.
// Throws Error{Errc::invalid_input} when the buffer is empty or not a whole
// number of pixels, or when max_colors is outside [1, 256].
auto quantize(std::span<u8 const> pixels,
              usize max_colors = max_palette_colors) -> QuantizedFrame;

} // namespace flipbook::gif
