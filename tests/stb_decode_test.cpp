// Round trips through stb_image's GIF decoder, an implementation independent
// of this encoder and of the reader in gif_reader.cpp.

#include "gif.hpp"

#include <gtest/gtest.h>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

#include <memory>
#include <vector>

using namespace flipbook::gif;

namespace {

struct StbAnimation {
    int width = 0;
    int height = 0;
    int frame_count = 0;
    std::vector<u8> pixels; // frame_count RGBA images, back to back
    std::vector<int> delays_ms;
};

auto stb_decode(std::vector<u8> const &bytes) -> StbAnimation {
    int *delays = nullptr;
    int comp = 0;
    StbAnimation out;

    auto *data = stbi_load_gif_from_memory(
        bytes.data(), static_cast<int>(bytes.size()), &delays, &out.width,
        &out.height, &out.frame_count, &comp, 4);

    std::unique_ptr<stbi_uc, void (*)(stbi_uc *)> image{
        data, [](stbi_uc *a) { stbi_image_free(a); }};
    std::unique_ptr<int, void (*)(int *)> delay_list{
        delays, [](int *d) { stbi_image_free(d); }};

    if (!image) {
        ADD_FAILURE() << "stb_image rejected the file: "
                      << stbi_failure_reason();
        return {};
    }

    auto const size = static_cast<usize>(out.width) * out.height * 4 *
                      static_cast<usize>(out.frame_count);
    out.pixels.assign(image.get(), image.get() + size);
    if (delay_list)
        out.delays_ms.assign(delay_list.get(),
                             delay_list.get() + out.frame_count);

    return out;
}

} // namespace

/// @brief Test fixture for decoding encoder output with stb_image
class StbDecodeTest : public ::testing::Test {
protected:
    static auto solid(usize width, usize height, u8 r, u8 g, u8 b)
        -> std::vector<u8> {
        std::vector<u8> out;
        out.reserve(width * height * 4);
        for (usize i{}; i < width * height; ++i)
            out.insert(out.end(), {r, g, b, 255});
        return out;
    }

    static auto gradient(usize width, usize height, int phase)
        -> std::vector<u8> {
        std::vector<u8> out(width * height * 4);
        for (usize y{}; y < height; ++y) {
            for (usize x{}; x < width; ++x) {
                auto *px = &out[(y * width + x) * 4];
                px[0] = static_cast<u8>(x * 5 + phase);
                px[1] = static_cast<u8>(y * 5);
                px[2] = static_cast<u8>((x + y) * 3 + phase * 2);
                px[3] = 255;
            }
        }
        return out;
    }

    static auto noise(usize width, usize height, u32 seed) -> std::vector<u8> {
        std::vector<u8> out(width * height * 4);
        for (usize i{}; i < out.size(); ++i) {
            seed = seed * 1664525 + 1013904223;
            out[i] = (i % 4 == 3) ? 255 : static_cast<u8>(seed >> 24);
        }
        return out;
    }

    // Encodes the frames, decodes them with stb_image and compares every
    // pixel with the palette color the quantizer assigns to it.
    static void expect_stb_round_trip(
        std::vector<std::vector<u8>> const &frames, usize width, usize height,
        u32 delay_ms = 100) {
        std::vector<Frame> views;
        for (auto const &f : frames)
            views.push_back({f, delay_ms});

        auto const decoded = stb_decode(encode(views, width, height, true));

        ASSERT_EQ(decoded.frame_count, static_cast<int>(frames.size()));
        ASSERT_EQ(decoded.width, static_cast<int>(width));
        ASSERT_EQ(decoded.height, static_cast<int>(height));

        auto const image_size = width * height * 4;
        auto const expected_delay =
            static_cast<int>(delay_to_centiseconds(delay_ms)) * 10;

        for (usize f{}; f < frames.size(); ++f) {
            auto const q = quantize(frames[f]);
            auto const *out = decoded.pixels.data() + f * image_size;

            if (!decoded.delays_ms.empty())
                EXPECT_EQ(decoded.delays_ms[f], expected_delay);

            for (usize i{}; i < width * height; ++i) {
                auto const idx = q.indices[i];
                auto const *px = out + i * 4;
                ASSERT_EQ(px[0], q.palette.r[idx])
                    << "frame " << f << " pixel " << i;
                ASSERT_EQ(px[1], q.palette.g[idx])
                    << "frame " << f << " pixel " << i;
                ASSERT_EQ(px[2], q.palette.b[idx])
                    << "frame " << f << " pixel " << i;
                ASSERT_EQ(px[3], 255) << "frame " << f << " pixel " << i;
            }
        }
    }
};

// ================== Small frames ==================

TEST_F(StbDecodeTest, FourColorFrame) {
    std::vector<u8> const pixels{255, 0,   0,   255, 0,   255, 0,   255,
                                 0,   0,   255, 255, 255, 255, 255, 255};

    expect_stb_round_trip({pixels}, 2, 2);
}

TEST_F(StbDecodeTest, SinglePixelFrames) {
    expect_stb_round_trip({solid(1, 1, 30, 60, 90), solid(1, 1, 30, 60, 90),
                           solid(1, 1, 200, 10, 10)},
                          1, 1, 50);
}

TEST_F(StbDecodeTest, ZeroDelayDecodesAsTenMilliseconds) {
    expect_stb_round_trip({solid(3, 3, 1, 2, 3)}, 3, 3, 0);
}

// ================== Code width boundaries ==================

TEST_F(StbDecodeTest, SolidColumnsOfEveryHeight) {
    // a one-color frame grows the dictionary by one code per emitted code,
    // so some of these streams end exactly as a code width fills up
    for (usize n = 1; n <= 300; ++n) {
        SCOPED_TRACE(n);
        expect_stb_round_trip({solid(1, n, 90, 180, 45)}, 1, n);
        if (HasFatalFailure()) return;
    }
}

TEST_F(StbDecodeTest, TwoColorRowsOfEveryWidth) {
    for (usize n = 1; n <= 300; ++n) {
        auto pixels = solid(n, 1, 255, 255, 255);
        for (usize i{}; i < n; i += 3)
            pixels[i * 4] = 0;

        SCOPED_TRACE(n);
        expect_stb_round_trip({pixels}, n, 1);
        if (HasFatalFailure()) return;
    }
}

// ================== Larger frames ==================

TEST_F(StbDecodeTest, GradientAnimation) {
    std::vector<std::vector<u8>> frames;
    for (int i = 0; i < 6; ++i)
        frames.push_back(gradient(48, 32, i * 9));

    expect_stb_round_trip(frames, 48, 32, 80);
}

TEST_F(StbDecodeTest, FullDictionaryFrame) {
    // 72x72 pixels of noise over a 256-color palette emit more than the 3838
    // codes that fill the dictionary, so the tail of the frame is written with
    // the dictionary frozen at 4096 entries. stb_image keeps numbering codes
    // past 4095 into its own 8192-entry table rather than freezing, so the
    // frame stays small enough not to overrun that table.
    expect_stb_round_trip({noise(72, 72, 17)}, 72, 72);
}

TEST_F(StbDecodeTest, ReducedPalettes) {
    for (usize max_colors : {2, 16, 100}) {
        auto const pixels = gradient(40, 40, 3);
        std::vector<Frame> const frames{{pixels, 100}};

        EncodeOptions opts;
        opts.max_colors = max_colors;

        auto const decoded =
            stb_decode(encode(frames, 40, 40, false, opts));
        ASSERT_EQ(decoded.frame_count, 1);

        auto const q = quantize(pixels, max_colors);
        for (usize i{}; i < 40 * 40; ++i) {
            auto const idx = q.indices[i];
            ASSERT_EQ(decoded.pixels[i * 4 + 0], q.palette.r[idx]);
            ASSERT_EQ(decoded.pixels[i * 4 + 1], q.palette.g[idx]);
            ASSERT_EQ(decoded.pixels[i * 4 + 2], q.palette.b[idx]);
        }
    }
}
