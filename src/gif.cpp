#include "gif.hpp"

#include "lzw.hpp"

#include <algorithm>
#include <cstdio>
#include <future>
#include <memory>
#include <string>
#include <thread>

namespace flipbook::gif {

namespace {

// === prototypes ===

/// Checks the dimensions and every frame buffer before any work is done, so a
/// bad call never gets as far as building blocks.
void validate(std::span<Frame const> frames, usize width, usize height);

/// Quantizes all frames, spread over at most `threads` workers (never more than
/// the hardware runs concurrently). Results are stored in frame order.
auto quantize_all(std::span<Frame const> frames, usize max_colors,
                  unsigned threads) -> std::vector<QuantizedFrame>;

/// Appends the graphic control, image descriptor, color table and image data
/// blocks of one quantized frame.
void append_frame_blocks(std::vector<Block> &blocks, QuantizedFrame const &q,
                         u16 width, u16 height, u32 delay_ms);

// === implementations ===

void validate(std::span<Frame const> frames, usize width, usize height) {
    if (frames.empty()) throw Error{Errc::empty_input, "no frames to encode"};

    if (width == 0 || height == 0 || width > max_u16 || height > max_u16)
        throw Error{Errc::invalid_input,
                    "dimensions " + std::to_string(width) + "x" +
                        std::to_string(height) + " are outside [1, 65535]"};

    auto const image_size = width * height * 4;
    for (usize i{}; i < frames.size(); ++i) {
        if (frames[i].pixels.size() != image_size)
            throw Error{Errc::invalid_input,
                        "frame " + std::to_string(i) + " has " +
                            std::to_string(frames[i].pixels.size()) +
                            " bytes, expected " + std::to_string(image_size)};
    }
}

auto quantize_all(std::span<Frame const> frames, usize max_colors,
                  unsigned threads) -> std::vector<QuantizedFrame> {
    std::vector<QuantizedFrame> out(frames.size());

    auto const hw = std::max(std::thread::hardware_concurrency(), 1u);
    auto const workers = std::min<usize>({threads, hw, frames.size()});
    std::vector<std::future<void>> jobs;
    jobs.reserve(workers);

    // worker w takes frames w, w + workers, w + 2 * workers, ...
    for (usize w{}; w < workers; ++w) {
        jobs.push_back(std::async(std::launch::async, [&, w] {
            for (auto i = w; i < frames.size(); i += workers)
                out[i] = quantize(frames[i].pixels, max_colors);
        }));
    }

    // get() rethrows the first failure; the remaining futures join on
    // destruction so `out` outlives every worker
    for (auto &job : jobs)
        job.get();

    return out;
}

void append_frame_blocks(std::vector<Block> &blocks, QuantizedFrame const &q,
                         u16 width, u16 height, u32 delay_ms) {
    auto const &pal = q.palette;
    auto const min_code_size = lzw::min_code_size(pal.size());

    blocks.emplace_back(GraphicControl{
        .delay = delay_to_centiseconds(delay_ms),
    });
    blocks.emplace_back(ImageDescriptor{
        .left = 0,
        .top = 0,
        .width = width,
        .height = height,
        .table_bits = pal.bit_depth,
    });
    blocks.emplace_back(ColorTable{pal});
    blocks.emplace_back(ImageData{
        .min_code_size = min_code_size,
        .compressed = lzw::encode(q.indices, min_code_size),
    });
}

} // namespace

auto build_blocks(std::span<Frame const> frames, usize width, usize height,
                  bool loop, EncodeOptions const &opts) -> std::vector<Block> {
    validate(frames, width, height);

    auto const w = static_cast<u16>(width);
    auto const h = static_cast<u16>(height);

    std::vector<Block> blocks;
    blocks.reserve(3 + frames.size() * 4);

    blocks.emplace_back(Header{});
    blocks.emplace_back(ScreenDescriptor{.width = w, .height = h});
    if (loop) blocks.emplace_back(LoopExtension{.loop_count = 0});

    // with several threads every frame is quantized up front, otherwise one
    // at a time so only a single indexed buffer is alive
    std::vector<QuantizedFrame> quantized;
    if (opts.threads > 1)
        quantized = quantize_all(frames, opts.max_colors, opts.threads);

    for (usize i{}; i < frames.size(); ++i) {
        if (quantized.empty()) {
            auto const q = quantize(frames[i].pixels, opts.max_colors);
            append_frame_blocks(blocks, q, w, h, frames[i].delay_ms);
        } else {
            append_frame_blocks(blocks, quantized[i], w, h, frames[i].delay_ms);
            quantized[i] = {};
        }

        if (opts.on_progress) opts.on_progress(i + 1, frames.size());
    }

    blocks.emplace_back(Trailer{});

    return blocks;
}

auto encode(std::span<Frame const> frames, usize width, usize height,
            bool loop, EncodeOptions const &opts) -> std::vector<u8> {
    auto const blocks = build_blocks(frames, width, height, loop, opts);
    return serialize(blocks);
}

auto write_file(std::string const &filename, std::span<u8 const> bytes)
    -> bool {
    using File = std::unique_ptr<FILE, void (*)(FILE *)>;

    FILE *f{};
#if defined(_MSC_VER) && (_MSC_VER >= 1400)
    fopen_s(&f, filename.c_str(), "wb");
#else
    f = fopen(filename.c_str(), "wb");
#endif
    if (!f) return false;

    File file{f, [](FILE *f) { fclose(f); }};
    if (fwrite(bytes.data(), 1, bytes.size(), file.get()) != bytes.size())
        return false;

    // report a failed close, it may be where buffered data is lost
    return fclose(file.release()) == 0;
}

// === Encoder methods ===

void Encoder::add_frame(std::span<u8 const> pixels) {
    add_frame(pixels, delay_for_fps(opts.fps));
}

void Encoder::add_frame(std::span<u8 const> pixels, u32 delay_ms) {
    frames.push_back(
        {std::vector<u8>(pixels.begin(), pixels.end()), delay_ms});
}

void Encoder::add_frame(std::vector<u8> &&pixels, u32 delay_ms) {
    frames.push_back({std::move(pixels), delay_ms});
}

auto Encoder::encode() const -> std::vector<u8> {
    std::vector<Frame> views;
    views.reserve(frames.size());
    for (auto const &f : frames)
        views.push_back({f.pixels, f.delay_ms});

    return gif::encode(views, opts.width, opts.height, opts.loop, opts.encode);
}

} // namespace flipbook::gif
