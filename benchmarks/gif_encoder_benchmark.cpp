#include <benchmark/benchmark.h>

#include "gif.hpp"
#include "lzw.hpp"
#include "quantize.hpp"

#include <cmath>
#include <vector>

using namespace flipbook::gif;

namespace {

constexpr usize bench_width = 480;
constexpr usize bench_height = 270;

// the same drifting pattern the command line example renders
auto render(usize width, usize height, float t) -> std::vector<u8> {
    std::vector<u8> out(width * height * 4);
    for (usize y{}; y < height; ++y) {
        for (usize x{}; x < width; ++x) {
            auto const u = static_cast<float>(x) / static_cast<float>(width);
            auto const v = static_cast<float>(y) / static_cast<float>(height);
            auto *px = &out[(y * width + x) * 4];
            px[0] = static_cast<u8>(255 * (0.5f + 0.5f * std::cos(t + u)));
            px[1] = static_cast<u8>(255 * (0.5f + 0.5f * std::cos(t + v + 2)));
            px[2] = static_cast<u8>(255 * (0.5f + 0.5f * std::cos(t + u + 4)));
            px[3] = 255;
        }
    }
    return out;
}

// every pixel unrelated to its neighbours
auto noise(usize width, usize height) -> std::vector<u8> {
    std::vector<u8> out(width * height * 4);
    u32 seed = 1;
    for (auto &v : out) {
        seed = seed * 1664525 + 1013904223;
        v = static_cast<u8>(seed >> 24);
    }
    return out;
}

} // namespace

/// @brief Quantize one smooth 480x270 frame
static void BM_Quantize_Gradient(benchmark::State &state) {
    auto const pixels = render(bench_width, bench_height, 0.f);

    for (auto _ : state) {
        auto q = quantize(pixels);
        benchmark::DoNotOptimize(q);
    }

    state.SetItemsProcessed(state.iterations());
    state.SetBytesProcessed(state.iterations() * pixels.size());
}
BENCHMARK(BM_Quantize_Gradient)->Iterations(100)->Unit(benchmark::kMicrosecond);

/// @brief Quantize random pixels, the nearest-color run cache never hits
static void BM_Quantize_Noise(benchmark::State &state) {
    auto const pixels = noise(bench_width, bench_height);

    for (auto _ : state) {
        auto q = quantize(pixels);
        benchmark::DoNotOptimize(q);
    }

    state.SetItemsProcessed(state.iterations());
    state.SetBytesProcessed(state.iterations() * pixels.size());
}
BENCHMARK(BM_Quantize_Noise)->Iterations(20)->Unit(benchmark::kMicrosecond);

/// @brief Compress the indices of one smooth frame
static void BM_Lzw_Gradient(benchmark::State &state) {
    auto const q = quantize(render(bench_width, bench_height, 0.f));
    auto const mcs = lzw::min_code_size(q.palette.size());

    for (auto _ : state) {
        auto out = lzw::encode(q.indices, mcs);
        benchmark::DoNotOptimize(out);
    }

    state.SetItemsProcessed(state.iterations());
    state.SetBytesProcessed(state.iterations() * q.indices.size());
}
BENCHMARK(BM_Lzw_Gradient)->Iterations(250)->Unit(benchmark::kMicrosecond);

/// @brief Compress random indices, the dictionary fills and freezes early
static void BM_Lzw_Noise(benchmark::State &state) {
    auto const q = quantize(noise(bench_width, bench_height));
    auto const mcs = lzw::min_code_size(q.palette.size());

    for (auto _ : state) {
        auto out = lzw::encode(q.indices, mcs);
        benchmark::DoNotOptimize(out);
    }

    state.SetItemsProcessed(state.iterations());
    state.SetBytesProcessed(state.iterations() * q.indices.size());
}
BENCHMARK(BM_Lzw_Noise)->Iterations(100)->Unit(benchmark::kMicrosecond);

/// @brief Encode a whole animation, one thread or several for quantization
static void BM_Encode_Animation(benchmark::State &state) {
    constexpr usize frame_count = 30;

    std::vector<std::vector<u8>> pixels;
    std::vector<Frame> frames;
    for (usize i{}; i < frame_count; ++i)
        pixels.push_back(render(bench_width, bench_height, 0.1f * i));
    for (auto const &p : pixels)
        frames.push_back({p, 100});

    EncodeOptions opts;
    opts.threads = static_cast<unsigned>(state.range(0));

    for (auto _ : state) {
        auto out = encode(frames, bench_width, bench_height, true, opts);
        benchmark::DoNotOptimize(out);
    }

    state.SetItemsProcessed(state.iterations() * frame_count);
    state.SetBytesProcessed(state.iterations() * frame_count * bench_width *
                            bench_height * 4);
}
BENCHMARK(BM_Encode_Animation)
    ->Arg(1)
    ->Arg(4)
    ->Iterations(5)
    ->Unit(benchmark::kMillisecond);
