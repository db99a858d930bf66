#pragma once

// The GIF89a blocks this encoder emits, one small record per block kind.
// Each record only knows how to append its own bytes; ordering is the
// assembler's business.

#include "common.hpp"
#include "quantize.hpp"

#include <span>
#include <variant>
#include <vector>

namespace flipbook::gif {

constexpr u8 extension_introducer = 0x21;
constexpr u8 graphic_control_label = 0xf9;
constexpr u8 application_label = 0xff;
constexpr u8 image_separator = 0x2c;
constexpr u8 trailer_byte = 0x3b;

// largest payload of one data sub-block
constexpr usize max_sub_block = 255;

// "GIF89a"
struct Header {
    void write(std::vector<u8> &out) const;
};

struct ScreenDescriptor {
    u16 width = 0;
    u16 height = 0;

    // no global color table, color resolution 7
    static constexpr u8 packed = 0x70;

    void write(std::vector<u8> &out) const;
};

// NETSCAPE2.0 application extension, loop_count 0 loops forever
struct LoopExtension {
    u16 loop_count = 0;

    void write(std::vector<u8> &out) const;
};

struct GraphicControl {
    u16 delay = 1;   // centiseconds
    u8 disposal = 0; // 0: no disposal specified
    bool transparent = false;
    u8 transparent_index = 0;

    void write(std::vector<u8> &out) const;
};

struct ImageDescriptor {
    u16 left = 0;
    u16 top = 0;
    u16 width = 0;
    u16 height = 0;
    int table_bits = 1; // local color table holds 1 << table_bits entries

    void write(std::vector<u8> &out) const;
};

struct ColorTable {
    Palette palette;

    void write(std::vector<u8> &out) const;
};

// LZW minimum code size followed by the compressed stream in sub-blocks
struct ImageData {
    int min_code_size = 2;
    std::vector<u8> compressed;

    void write(std::vector<u8> &out) const;
};

struct Trailer {
    void write(std::vector<u8> &out) const;
};

using Block = std::variant<Header, ScreenDescriptor, LoopExtension,
                           GraphicControl, ImageDescriptor, ColorTable,
                           ImageData, Trailer>;

// little-endian 16-bit word
inline void put_u16(std::vector<u8> &out, u16 v) {
    out.push_back(static_cast<u8>(v & 0xff));
    out.push_back(static_cast<u8>((v >> 8) & 0xff));
}

// splits data into length-prefixed sub-blocks of at most 255 bytes and
// appends the zero-length terminator
void write_sub_blocks(std::vector<u8> &out, std::span<u8 const> data);

void write_block(std::vector<u8> &out, Block const &block);

auto serialize(std::span<Block const> blocks) -> std::vector<u8>;

} // namespace flipbook::gif
