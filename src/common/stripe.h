#pragma once

#include <cstddef>
#include <vector>

namespace FleetLayout {

/**
 * Interleaves the given lists: element 0 of every list (in list order), then
 * element 1 of every list, and so on. Lists that run out are skipped, so the
 * result always holds every input element exactly once.
 *
 *   Stripe({{0, 4, 8}, {1, 5}, {2}}) == {0, 1, 2, 4, 5, 8}
 */
template<typename T>
std::vector<T> Stripe(const std::vector<std::vector<T>>& lists) {
    size_t total = 0;
    size_t longest = 0;
    for (const auto& list : lists) {
        total += list.size();
        if (list.size() > longest) {
            longest = list.size();
        }
    }

    std::vector<T> result;
    result.reserve(total);
    for (size_t i = 0; i < longest; ++i) {
        for (const auto& list : lists) {
            if (i < list.size()) {
                result.push_back(list[i]);
            }
        }
    }
    return result;
}

} // namespace FleetLayout
