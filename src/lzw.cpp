#include "lzw.hpp"

#include <string>

namespace flipbook::gif::lzw {

namespace {

/// The LZW dictionary is a tree with one node per code, each node holding the
/// code of its child for every symbol of the alphabet. Zero marks a missing
/// child, no real child can have code 0 since children start after EOI.
class CodeTree {
public:
    explicit CodeTree(u32 alphabet_size)
        : alphabet{alphabet_size}, next(max_codes * alphabet_size, 0) {}

    [[nodiscard]] auto find(u32 prefix, u8 symbol) const -> u16 {
        return next[prefix * alphabet + symbol];
    }

    void insert(u32 prefix, u8 symbol, u32 code) {
        next[prefix * alphabet + symbol] = static_cast<u16>(code);
    }

private:
    u32 alphabet;
    std::vector<u16> next;
};

void check_symbol(u8 symbol, u32 alphabet, usize pos) {
    if (symbol >= alphabet)
        throw Error{Errc::invalid_input,
                    "index " + std::to_string(symbol) + " at pixel " +
                        std::to_string(pos) + " exceeds the " +
                        std::to_string(alphabet) + " color alphabet"};
}

} // namespace

// === BitWriter methods ===

void BitWriter::write_code(u32 code, u32 length) {
    if (length > max_code_bits || code >= (u32{1} << length))
        throw Error{Errc::encoding_overflow,
                    "code " + std::to_string(code) + " does not fit in " +
                        std::to_string(length) + " bits"};

    bits |= code << bit_count;
    bit_count += length;

    while (bit_count >= 8) {
        out.push_back(static_cast<u8>(bits & 0xff));
        bits >>= 8;
        bit_count -= 8;
    }
}

void BitWriter::flush() {
    if (bit_count > 0) out.push_back(static_cast<u8>(bits & 0xff));

    bits = 0;
    bit_count = 0;
}

// === compression ===

auto encode(std::span<u8 const> indices, int min_code_size)
    -> std::vector<u8> {
    if (min_code_size < 2 || min_code_size > 8)
        throw Error{Errc::invalid_input,
                    "minimum code size " + std::to_string(min_code_size) +
                        " is outside [2, 8]"};

    auto const alphabet = u32{1} << min_code_size;
    auto const clear_code = alphabet;
    auto const eoi_code = clear_code + 1;

    auto code_size = static_cast<u32>(min_code_size + 1);
    auto next_code = clear_code + 2;

    CodeTree codetree{alphabet};
    BitWriter stat;

    // start with a fresh LZW dictionary
    stat.write_code(clear_code, code_size);

    if (indices.empty()) {
        stat.write_code(eoi_code, code_size);
        stat.flush();
        return stat.take();
    }

    check_symbol(indices[0], alphabet, 0);
    u32 curr_code = indices[0];

    for (usize i{1}; i < indices.size(); ++i) {
        auto const next_value = indices[i];
        check_symbol(next_value, alphabet, i);

        if (auto const child = codetree.find(curr_code, next_value)) {
            // current run already in the dictionary
            curr_code = child;
            continue;
        }

        // finish the current run, write a code
        stat.write_code(curr_code, code_size);

        // a full dictionary stays frozen until the end of the frame
        if (next_code < max_codes) {
            codetree.insert(curr_code, next_value, next_code++);

            // the next code no longer fits, widen
            if (next_code > (u32{1} << code_size) && code_size < max_code_bits)
                ++code_size;
        }

        curr_code = next_value;
    }

    // compression footer
    stat.write_code(curr_code, code_size);

    // a decoder adds one more entry when it reads the final code and widens
    // as soon as that entry fills the current width
    if (next_code == (u32{1} << code_size) && code_size < max_code_bits)
        ++code_size;

    stat.write_code(eoi_code, code_size);
    stat.flush();

    return stat.take();
}

} // namespace flipbook::gif::lzw
