#include "quantize.hpp"

#include <algorithm>
#include <limits>

namespace flipbook::gif {

namespace {

/// A coarse color bucket and how many pixels fell into it.
struct Bucket {
    u16 key;
    u32 count;
};

constexpr auto bucket_key(u8 r, u8 g, u8 b) -> u16 {
    return static_cast<u16>(((r >> 3) << 10) | ((g >> 3) << 5) | (b >> 3));
}

constexpr auto bucket_red(u16 key) -> u8 {
    return static_cast<u8>(((key >> 10) & 0x1f) << 3);
}
constexpr auto bucket_green(u16 key) -> u8 {
    return static_cast<u8>(((key >> 5) & 0x1f) << 3);
}
constexpr auto bucket_blue(u16 key) -> u8 {
    return static_cast<u8>((key & 0x1f) << 3);
}

static_assert(bucket_red(bucket_key(0xff, 0, 0)) == (0xff & coarse_mask));
static_assert(bucket_blue(bucket_key(0, 0, 0x47)) == (0x47 & coarse_mask));

/// Counts every coarse color in the frame. Buckets come back in the order
/// their first pixel appears, which is what makes the later sort stable.
auto build_histogram(std::span<u8 const> pixels) -> std::vector<Bucket> {
    static constexpr auto key_count = 1 << 15;
    static constexpr auto unseen = std::numeric_limits<u32>::max();

    std::vector<u32> slot(key_count, unseen);
    std::vector<Bucket> buckets;

    for (usize i{}; i < pixels.size(); i += 4) {
        auto const key = bucket_key(pixels[i], pixels[i + 1], pixels[i + 2]);

        if (slot[key] == unseen) {
            slot[key] = static_cast<u32>(buckets.size());
            buckets.push_back({key, 0});
        }

        ++buckets[slot[key]].count;
    }

    return buckets;
}

/// Most frequent buckets first, at most max_colors of them, padded with black
/// to a power of two of at least two entries.
auto build_palette(std::vector<Bucket> buckets, usize max_colors) -> Palette {
    std::stable_sort(
        buckets.begin(), buckets.end(),
        [](Bucket const &l, Bucket const &r) { return l.count > r.count; });

    auto const used = std::min(buckets.size(), max_colors);
    auto const size = next_power_of_two(std::max<usize>(used, 2));

    Palette pal;
    pal.bit_depth = log2_exact(size);

    // entries past `used` stay zero-initialized, i.e. black
    for (usize i{}; i < used; ++i) {
        pal.r[i] = bucket_red(buckets[i].key);
        pal.g[i] = bucket_green(buckets[i].key);
        pal.b[i] = bucket_blue(buckets[i].key);
    }

    return pal;
}

} // namespace

auto Palette::closest(int red, int green, int blue) const -> u8 {
    auto best_ind = 0;
    auto best_diff = std::numeric_limits<int>::max();

    for (usize i{}; i < size(); ++i) {
        auto const r_err = red - r[i];
        auto const g_err = green - g[i];
        auto const b_err = blue - b[i];
        auto const diff = r_err * r_err + g_err * g_err + b_err * b_err;

        if (diff < best_diff) {
            best_ind = static_cast<int>(i);
            best_diff = diff;
            if (diff == 0) break;
        }
    }

    return static_cast<u8>(best_ind);
}

void Palette::write(std::vector<u8> &out) const {
    for (usize i{}; i < size(); ++i) {
        out.push_back(r[i]);
        out.push_back(g[i]);
        out.push_back(b[i]);
    }
}

auto quantize(std::span<u8 const> pixels, usize max_colors) -> QuantizedFrame {
    if (pixels.empty())
        throw Error{Errc::invalid_input, "pixel buffer is empty"};
    if (pixels.size() % 4 != 0)
        throw Error{Errc::invalid_input,
                    "pixel buffer length is not a multiple of 4"};
    if (max_colors == 0 || max_colors > max_palette_colors)
        throw Error{Errc::invalid_input, "max colors must be in [1, 256]"};

    QuantizedFrame out;
    out.palette = build_palette(build_histogram(pixels), max_colors);

    auto const num_pixels = pixels.size() / 4;
    out.indices.resize(num_pixels);

    // runs of one color are common in rendered frames, reuse the last match
    auto last_rgb = -1;
    u8 last_ind = 0;

    for (usize i{}; i < num_pixels; ++i) {
        auto const *px = &pixels[i * 4];
        auto const rgb = (px[0] << 16) | (px[1] << 8) | px[2];

        if (rgb != last_rgb) {
            last_ind = out.palette.closest(px[0], px[1], px[2]);
            last_rgb = rgb;
        }

        out.indices[i] = last_ind;
    }

    return out;
}

} // namespace flipbook::gif
