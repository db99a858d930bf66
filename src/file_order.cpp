#include "file_order.hpp"

#include <algorithm>
#include <charconv>

namespace flipbook::gif {

auto file_number(std::string const &filename) -> usize {
    static constexpr auto const nums = "0123456789";

    auto const first = filename.find_first_of(nums);
    if (first == std::string::npos) return 0;

    auto n = filename.substr(first);
    n = n.substr(0, n.find_first_not_of(nums));

    usize v{};
    auto const [ptr, ec] = std::from_chars(n.data(), n.data() + n.size(), v);
    if (ec != std::errc{}) return 0;

    return v;
}

void sort_numeric(std::vector<std::string> &filenames) {
    std::stable_sort(filenames.begin(), filenames.end(),
                     [](std::string const &a, std::string const &b) {
                         return file_number(a) < file_number(b);
                     });
}

} // namespace flipbook::gif
