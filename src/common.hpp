#pragma once

#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace flipbook::gif {

using u8 = std::uint8_t;
using i8 = std::int8_t;
using u16 = std::uint16_t;
using i16 = std::int16_t;
using u32 = std::uint32_t;
using i32 = std::int32_t;
using u64 = std::uint64_t;
using i64 = std::int64_t;
using usize = std::size_t;

// largest value a GIF 16-bit field can hold (dimensions, delays)
constexpr usize max_u16 = 0xffff;

enum class Errc {
    invalid_input,     // bad pixel buffer, dimensions or parameters
    empty_input,       // no frames were given to the encoder
    encoding_overflow, // LZW stream invariant broken, should never happen
};

constexpr auto to_string(Errc e) -> char const * {
    switch (e) {
    case Errc::invalid_input: return "invalid input";
    case Errc::empty_input: return "empty input";
    case Errc::encoding_overflow: return "encoding overflow";
    }

    return "unknown error";
}

// Thrown by every encoding stage. An encode call either returns a complete
// buffer or throws one of these, never partial output.
class Error : public std::runtime_error {
public:
    Error(Errc code, std::string const &what)
        : std::runtime_error{std::string{to_string(code)} + ": " + what},
          code_{code} {}

    [[nodiscard]] auto code() const noexcept -> Errc { return code_; }

private:
    Errc code_;
};

// smallest power of two >= n, n must be <= 256
constexpr auto next_power_of_two(usize n) -> usize {
    usize p = 1;
    while (p < n)
        p <<= 1;
    return p;
}

// log2 of a power of two
constexpr auto log2_exact(usize n) -> int {
    auto bits = 0;
    while (n > 1) {
        n >>= 1;
        ++bits;
    }
    return bits;
}

} // namespace flipbook::gif
