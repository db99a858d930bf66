#pragma once

// flipbook turns a sequence of RGBA frames into an animated GIF89a file held in
// memory.
//
// Every frame is encoded on its own: it gets a local palette of its most
// frequent coarse colors (nearest-color mapping, at most 256 entries) and its
// own LZW dictionary. Nothing is shared between frames, so there is no delta
// encoding, no dithering and no transparency. Files come out larger than a
// global-palette encoder would make them, in exchange the frames can be
// quantized in parallel and the output is the same for any thread count.
//
// Only RGBA8 is currently supported as an input format. (The alpha is ignored.)
//
// USAGE:
// Either call encode() with the full list of frames, or collect frames in an
// Encoder with add_frame() and call Encoder::encode(). Both return the whole
// file as bytes; write_file() puts them on disk.
//

#include "blocks.hpp"
#include "common.hpp"
#include "quantize.hpp"

#include <functional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace flipbook::gif {

// One input frame. The pixels are borrowed, they must stay alive for the
// duration of the encode call and are never modified.
struct Frame {
    std::span<u8 const> pixels; // RGBA, width * height * 4 bytes, row-major
    u32 delay_ms = 100;
};

struct EncodeOptions {
    usize max_colors = max_palette_colors;

    // quantize up to this many frames at once, capped at
    // std::thread::hardware_concurrency() and at the frame count. Compression
    // and block output always happen in frame order on the calling thread.
    unsigned threads = 1;

    // called after the blocks of each frame are built
    std::function<void(usize done, usize total)> on_progress;
};

// GIF stores delays in hundredths of a second: round to the nearest one and
// never go below 1, since a zero delay means "as fast as possible" to many
// viewers.
constexpr auto delay_to_centiseconds(u32 delay_ms) -> u16 {
    auto const cs = (static_cast<u64>(delay_ms) + 5) / 10;
    if (cs < 1) return 1;
    if (cs > max_u16) return static_cast<u16>(max_u16);
    return static_cast<u16>(cs);
}

// frame delay in milliseconds for a given frame rate
constexpr auto delay_for_fps(u32 fps) -> u32 { return fps ? 1000 / fps : 0; }

// number of frames needed to cover duration_ms at the given frame rate,
// rounded up
constexpr auto frames_for_duration(u64 duration_ms, u32 fps) -> usize {
    return static_cast<usize>((duration_ms * fps + 999) / 1000);
}

// Builds the ordered block list for the whole file.
// Throws Error{Errc::empty_input} for an empty frame list and
// Error{Errc::invalid_input} for bad dimensions or a frame whose buffer is not
// width * height * 4 bytes.
auto build_blocks(std::span<Frame const> frames, usize width, usize height,
                  bool loop, EncodeOptions const &opts = {})
    -> std::vector<Block>;

// Encodes the frames into a complete GIF89a file. Same errors as
// build_blocks(), nothing is returned on failure.
auto encode(std::span<Frame const> frames, usize width, usize height,
            bool loop, EncodeOptions const &opts = {}) -> std::vector<u8>;

// writes the bytes to a file, returns false if it can't be opened or written
auto write_file(std::string const &filename, std::span<u8 const> bytes)
    -> bool;

// Collects frames (copying their pixels) and encodes them in one go.
class Encoder {
public:
    struct Options {
        usize width = 480;
        usize height = 270;
        u32 fps = 10; // default frame delay is 1000 / fps ms
        bool loop = true;
        EncodeOptions encode;
    };

    Encoder() = default;
    explicit Encoder(Options options) : opts{std::move(options)} {}

    void add_frame(std::span<u8 const> pixels);
    void add_frame(std::span<u8 const> pixels, u32 delay_ms);
    void add_frame(std::vector<u8> &&pixels, u32 delay_ms);

    [[nodiscard]] auto frame_count() const -> usize { return frames.size(); }
    [[nodiscard]] auto options() const -> Options const & { return opts; }

    // drop all collected frames
    void clear() { frames.clear(); }

    [[nodiscard]] auto encode() const -> std::vector<u8>;

private:
    struct OwnedFrame {
        std::vector<u8> pixels;
        u32 delay_ms;
    };

    Options opts;
    std::vector<OwnedFrame> frames;
};

} // namespace flipbook::gif
