#include "file_order.hpp"
#include "gif.hpp"

#include <CLI/CLI.hpp>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <memory>
#include <string>
#include <utility>
#include <vector>

using std::chrono::duration_cast;
using std::chrono::milliseconds;
using std::chrono::steady_clock;
using flipbook::gif::Encoder;
using flipbook::gif::EncodeOptions;
using flipbook::gif::Frame;
using flipbook::gif::u32;
using flipbook::gif::u8;
using flipbook::gif::usize;

namespace {

using Image = std::unique_ptr<stbi_uc[], void (*)(stbi_uc *)>;

auto load_rgba(std::string const &filename, int &w, int &h) -> Image {
    int n;
    return Image{stbi_load(filename.c_str(), &w, &h, &n, 4),
                 [](stbi_uc *a) { stbi_image_free(a); }};
}

void print_progress(usize done, usize total) {
    auto const p = static_cast<double>(done) / static_cast<double>(total);
    printf("Writing frame %zu/%zu... (%.02f%%)\r", done, total, p * 100);
    fflush(stdout);
}

// writes the file and reports timing, returns the process exit code
auto finish(std::vector<u8> const &bytes, std::string const &output_file,
            usize frame_count, steady_clock::time_point start) -> int {
    if (!flipbook::gif::write_file(output_file, bytes)) {
        fprintf(stderr, "Error writing output file: %s\n",
                output_file.c_str());
        return 1;
    }

    auto end = steady_clock::now();
    auto delta = duration_cast<milliseconds>(end - start).count();
    printf("\ndone %llds (%.02fms/frame), %zu bytes\n",
           static_cast<long long>(delta / 1000),
           static_cast<double>(delta) / static_cast<double>(frame_count),
           bytes.size());

    return 0;
}

auto example(std::string const &filename, usize width, usize height,
             u32 fps, u32 delay, u32 duration_ms, bool loop,
             EncodeOptions opts) -> int {
    auto const total_frames = std::max<usize>(
        flipbook::gif::frames_for_duration(duration_ms, fps), 1);

    opts.on_progress = print_progress;

    Encoder::Options encoder_opts{
        .width = width,
        .height = height,
        .fps = fps,
        .loop = loop,
        .encode = std::move(opts),
    };
    Encoder encoder{std::move(encoder_opts)};

    std::vector<u8> image(width * height * 4);

    auto set_pixel = [&](usize x, usize y, u8 red, u8 green, u8 blue) {
        u8 *pixel = &image[(y * width + x) * 4];
        pixel[0] = red;
        pixel[1] = green;
        pixel[2] = blue;
        pixel[3] = 255; // no alpha for this demo
    };

    auto set_pixel_float = [&](usize xx, usize yy, float fred, float fgrn,
                               float fblu) {
        // convert float to unorm
        auto const red = static_cast<u8>(roundf(255.0F * fred));
        auto const grn = static_cast<u8>(roundf(255.0F * fgrn));
        auto const blu = static_cast<u8>(roundf(255.0F * fblu));

        set_pixel(xx, yy, red, grn, blu);
    };

    auto start = steady_clock::now();

    for (usize frame{}; frame < total_frames; ++frame) {
        // Make an image, somehow
        // this is the default shadertoy - credit to shadertoy.com
        auto const tt = static_cast<float>(frame) * 3.14159F * 2 /
                        static_cast<float>(total_frames);
        for (usize y{}; y < height; ++y) {
            for (usize x{}; x < width; ++x) {
                float fx = static_cast<float>(x) / width;
                float fy = static_cast<float>(y) / height;

                float red = 0.5F + 0.5F * cosf(tt + fx);
                float grn = 0.5F + 0.5F * cosf(tt + fy + 2.F);
                float blu = 0.5F + 0.5F * cosf(tt + fx + 4.F);

                set_pixel_float(x, y, red, grn, blu);
            }
        }

        encoder.add_frame(image, delay);
    }

    try {
        return finish(encoder.encode(), filename, total_frames, start);
    } catch (flipbook::gif::Error const &e) {
        fprintf(stderr, "\nError encoding gif: %s\n", e.what());
        return 1;
    }
}

} // namespace

auto main(int argc, const char *argv[]) -> int {
    CLI::App app{"flipbook GIF maker"};

    std::vector<std::string> input_files;
    app.add_option("-i,--input-files", input_files,
                   "Frame images to encode, in order");

    std::string output_file;
    app.add_option("-o,--output-file", output_file,
                   "Name of the file to generate")
        ->default_val("out.gif");

    u32 delay;
    auto *delay_opt =
        app.add_option("--delay", delay, "Delay of each frame in milliseconds")
            ->default_val(100);

    u32 fps;
    app.add_option("--fps", fps, "Frame rate, sets the delay to 1000 / fps ms")
        ->default_val(10)
        ->check(CLI::Range(1, 100))
        ->excludes(delay_opt);

    usize max_colors;
    app.add_option("--max-colors", max_colors,
                   "Maximum number of colors per frame")
        ->default_val(256)
        ->check(CLI::Range(1, 256));

    bool no_loop = false;
    app.add_flag("--no-loop", no_loop, "Play the animation only once")
        ->default_val(false);

    unsigned threads;
    app.add_option("--threads", threads,
                   "Number of frames to quantize in parallel")
        ->default_val(1)
        ->check(CLI::Range(1, 64));

    bool gen_example = false;
    app.add_flag("--gen-example", gen_example, "Generate an example GIF file")
        ->default_val(false);

    usize width;
    app.add_option("--width", width, "Width of the example animation")
        ->default_val(480)
        ->check(CLI::Range(1, 65535));

    usize height;
    app.add_option("--height", height, "Height of the example animation")
        ->default_val(270)
        ->check(CLI::Range(1, 65535));

    u32 duration;
    app.add_option("--duration", duration,
                   "Length of the example animation in milliseconds")
        ->default_val(3000);

    bool numeric_sort = false;
    app.add_flag(
           "--numeric-sort", numeric_sort,
           "Try to find a number in all filenames and sort the list by it")
        ->default_val(false);

    CLI11_PARSE(app, argc, argv);

    auto const loop = !no_loop;
    auto const has_fps = app.count("--fps") > 0;
    auto const frame_delay = has_fps ? flipbook::gif::delay_for_fps(fps) : delay;

    EncodeOptions opts;
    opts.max_colors = max_colors;
    opts.threads = threads;

    if (gen_example) {
        // frame count follows the frame rate, or the delay when none is given
        auto const example_fps =
            has_fps ? fps : std::max<u32>(1000 / std::max<u32>(delay, 1), 1);
        return example(output_file, width, height, example_fps, frame_delay,
                       duration, loop, std::move(opts));
    }

    if (input_files.empty()) {
        fprintf(stderr, "--input-files requires at least one argument\n");
        return 1;
    }

    if (numeric_sort) flipbook::gif::sort_numeric(input_files);

    auto start = steady_clock::now();

    int w = 0;
    int h = 0;
    std::vector<Image> images;
    std::vector<Frame> frames;

    for (auto const &file : input_files) {
        int fw;
        int fh;
        auto data = load_rgba(file, fw, fh);
        if (!data) {
            fprintf(stderr, "Error opening input file: %s (%s)\n", file.c_str(),
                    stbi_failure_reason());
            return 1;
        }

        if (images.empty()) {
            w = fw;
            h = fh;
        } else if (fw != w || fh != h) {
            // no resampling, every frame must match the first
            fprintf(stderr, "Input file %s is %dx%d, expected %dx%d\n",
                    file.c_str(), fw, fh, w, h);
            return 1;
        }

        auto const size = static_cast<usize>(w) * static_cast<usize>(h) * 4;
        frames.push_back({{data.get(), size}, frame_delay});
        images.push_back(std::move(data));
    }

    opts.on_progress = print_progress;

    try {
        auto const bytes = flipbook::gif::encode(
            frames, static_cast<usize>(w), static_cast<usize>(h), loop, opts);
        return finish(bytes, output_file, frames.size(), start);
    } catch (flipbook::gif::Error const &e) {
        fprintf(stderr, "\nError encoding gif: %s\n", e.what());
        return 1;
    }
}
