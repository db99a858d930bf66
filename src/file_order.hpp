#pragma once

// Ordering of input frame files for the command line tool.

#include "common.hpp"

#include <string>
#include <vector>

namespace flipbook::gif {

// The first run of digits in `filename` as a number, e.g. 12 for
// "frame_012_b3.png". Names without digits (or with a number too large to
// represent) give 0.
auto file_number(std::string const &filename) -> usize;

// Sorts file names by file_number(), so "f2.png" comes before "f10.png".
// Names with equal numbers keep their relative order.
void sort_numeric(std::vector<std::string> &filenames);

} // namespace flipbook::gif
