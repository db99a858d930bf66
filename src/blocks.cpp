#include "blocks.hpp"

#include <algorithm>
#include <string_view>

namespace flipbook::gif {

namespace {

void put_string(std::vector<u8> &out, std::string_view s) {
    out.insert(out.end(), s.begin(), s.end());
}

} // namespace

void Header::write(std::vector<u8> &out) const { put_string(out, "GIF89a"); }

void ScreenDescriptor::write(std::vector<u8> &out) const {
    put_u16(out, width);
    put_u16(out, height);

    out.push_back(packed);
    out.push_back(0); // background color
    // pixels are square (we need to specify this because it's 1989)
    out.push_back(0);
}

void LoopExtension::write(std::vector<u8> &out) const {
    out.push_back(extension_introducer);
    out.push_back(application_label);
    out.push_back(11);              // length 11
    put_string(out, "NETSCAPE2.0"); // yes, really
    out.push_back(3);               // 3 bytes of NETSCAPE2.0 data

    out.push_back(1); // sub-block id: loop count follows
    put_u16(out, loop_count);

    out.push_back(0); // block terminator
}

void GraphicControl::write(std::vector<u8> &out) const {
    out.push_back(extension_introducer);
    out.push_back(graphic_control_label);
    out.push_back(0x04);

    // reserved:3, disposal:3, user input:1, transparency:1
    out.push_back(static_cast<u8>(((disposal & 0x07) << 2) |
                                  (transparent ? 0x01 : 0x00)));
    put_u16(out, delay);
    out.push_back(transparent_index);

    out.push_back(0); // block terminator
}

void ImageDescriptor::write(std::vector<u8> &out) const {
    out.push_back(image_separator);

    put_u16(out, left); // corner of image in canvas space
    put_u16(out, top);
    put_u16(out, width);
    put_u16(out, height);

    // local color table present, 2 ^ table_bits entries, not interlaced
    out.push_back(static_cast<u8>(0x80 | ((table_bits - 1) & 0x07)));
}

void ColorTable::write(std::vector<u8> &out) const { palette.write(out); }

void ImageData::write(std::vector<u8> &out) const {
    out.push_back(static_cast<u8>(min_code_size));
    write_sub_blocks(out, compressed);
}

void Trailer::write(std::vector<u8> &out) const { out.push_back(trailer_byte); }

void write_sub_blocks(std::vector<u8> &out, std::span<u8 const> data) {
    while (!data.empty()) {
        auto const chunk = std::min(data.size(), max_sub_block);

        out.push_back(static_cast<u8>(chunk));
        out.insert(out.end(), data.begin(), data.begin() + chunk);

        data = data.subspan(chunk);
    }

    out.push_back(0); // image block terminator
}

void write_block(std::vector<u8> &out, Block const &block) {
    std::visit([&](auto const &b) { b.write(out); }, block);
}

auto serialize(std::span<Block const> blocks) -> std::vector<u8> {
    std::vector<u8> out;
    for (auto const &block : blocks)
        write_block(out, block);

    return out;
}

} // namespace flipbook::gif
