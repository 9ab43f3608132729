#pragma once

#include <range/v3/algorithm/search.hpp>

#include <cstddef>
#include <iterator>
#include <span>
#include <vector>

namespace ranges {

/// Returns the offsets of all (possibly overlapping) occurrences of needle in haystack, in ascending order
template<typename Needle>
std::vector<std::size_t> find_all_offsets(std::span<const unsigned char> haystack, const Needle& needle) {
    std::vector<std::size_t> offsets;
    auto begin = haystack.begin();
    while (true) {
        auto match = ranges::search(begin, haystack.end(), std::begin(needle), std::end(needle));
        if (match.empty()) {
            break;
        }
        offsets.push_back(static_cast<std::size_t>(match.begin() - haystack.begin()));
        begin = match.begin() + 1;
    }
    return offsets;
}

}
