#pragma once

// Variable code width LZW compression of palette index streams, as GIF
// image data requires it.

#include "common.hpp"

#include <span>
#include <utility>
#include <vector>

namespace flipbook::gif::lzw {

constexpr u32 max_code_bits = 12;
constexpr u32 max_codes = 1 << max_code_bits; // codes 0..4095

// Packs codes into bytes, least significant bit first.
class BitWriter {
public:
    // append `length` bits of `code`. Throws Error{Errc::encoding_overflow}
    // if the code does not fit in length bits or length exceeds 12.
    void write_code(u32 code, u32 length);

    // write out the last partial byte, padded with zero bits
    void flush();

    [[nodiscard]] auto bytes() const -> std::vector<u8> const & {
        return out;
    }
    [[nodiscard]] auto take() -> std::vector<u8> { return std::move(out); }

private:
    u32 bits = 0;      // pending bits, lowest first
    u32 bit_count = 0; // how many of them are valid
    std::vector<u8> out;
};

// minimum code size for a color table of `palette_size` entries:
// max(2, ceil(log2(palette_size)))
constexpr auto min_code_size(usize palette_size) -> int {
    auto bits = 0;
    while ((usize{1} << bits) < palette_size)
        ++bits;
    return bits < 2 ? 2 : bits;
}

// Compresses `indices` (every value < 2^min_code_size) into a GIF LZW code
// stream: a Clear code, the data codes, then End-of-Information. The
// dictionary grows up to code 4095 and then stays frozen, no Clear code is
// issued mid-stream.
//
// Throws Error{Errc::invalid_input} when min_code_size is outside [2, 8] or
// an index does not fit the alphabet.
auto encode(std::span<u8 const> indices, int min_code_size) -> std::vector<u8>;

} // namespace flipbook::gif::lzw
