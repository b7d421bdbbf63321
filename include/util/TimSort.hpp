#pragma once

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <vector>

namespace cadence::util {

/// Shortest run worth merging for an input of n elements. Chosen so that
/// n / min_run is a power of two or slightly below one.
size_t min_run_length(size_t n);

namespace detail {

struct PendingRun {
    size_t start;
    size_t length;
};

// Length of the natural run at first. A strictly descending run is
// reversed in place; strictness keeps equal elements in order.
template<typename RandomIt, typename Compare>
size_t take_run(RandomIt first, RandomIt last, Compare& comp) {
    auto end = std::next(first);
    if (end == last) return 1;

    if (comp(*end, *first)) {
        while (end != last && comp(*end, *std::prev(end))) ++end;
        std::reverse(first, end);
    } else {
        while (end != last && !comp(*end, *std::prev(end))) ++end;
    }
    return static_cast<size_t>(std::distance(first, end));
}

// Insertion sort of [first, last) where [first, sorted_end) is already in order
template<typename RandomIt, typename Compare>
void extend_run(RandomIt first, RandomIt sorted_end, RandomIt last, Compare& comp) {
    for (auto it = sorted_end; it != last; ++it) {
        // upper_bound lands after equal keys, which preserves stability
        auto pos = std::upper_bound(first, it, *it, comp);
        std::rotate(pos, it, std::next(it));
    }
}

template<typename RandomIt, typename Compare>
void merge_runs(RandomIt first, std::vector<PendingRun>& stack, size_t i, Compare& comp) {
    auto& a = stack[i];
    const auto& b = stack[i + 1];
    auto lo = first + static_cast<std::ptrdiff_t>(a.start);
    auto mid = lo + static_cast<std::ptrdiff_t>(a.length);
    auto hi = mid + static_cast<std::ptrdiff_t>(b.length);
    std::inplace_merge(lo, mid, hi, comp);
    a.length += b.length;
    stack.erase(stack.begin() + static_cast<std::ptrdiff_t>(i) + 1);
}

// Restore the run-length invariants on the top of the stack:
// |X| > |Y| + |Z| and |Y| > |Z|
template<typename RandomIt, typename Compare>
void balance(RandomIt first, std::vector<PendingRun>& stack, Compare& comp) {
    while (stack.size() > 1) {
        size_t n = stack.size() - 2;
        bool x_too_small = n > 0 && stack[n - 1].length <= stack[n].length + stack[n + 1].length;
        if (x_too_small) {
            if (stack[n - 1].length < stack[n + 1].length) --n;
        } else if (stack[n].length > stack[n + 1].length) {
            return;
        }
        merge_runs(first, stack, n, comp);
    }
}

}  // namespace detail

/**
 * Stable adaptive merge sort (TimSort).
 * Linear on already ordered input, O(n log n) otherwise. Elements that
 * compare equal keep their relative order.
 */
template<typename RandomIt, typename Compare>
void timsort(RandomIt first, RandomIt last, Compare comp) {
    const size_t n = static_cast<size_t>(std::distance(first, last));
    if (n < 2) return;

    const size_t min_run = min_run_length(n);
    std::vector<detail::PendingRun> stack;

    size_t pos = 0;
    while (pos < n) {
        auto run_first = first + static_cast<std::ptrdiff_t>(pos);
        size_t len = detail::take_run(run_first, last, comp);

        if (len < min_run) {
            size_t forced = std::min(n - pos, min_run);
            detail::extend_run(run_first,
                               run_first + static_cast<std::ptrdiff_t>(len),
                               run_first + static_cast<std::ptrdiff_t>(forced),
                               comp);
            len = forced;
        }

        stack.push_back({pos, len});
        detail::balance(first, stack, comp);
        pos += len;
    }

    while (stack.size() > 1) {
        size_t i = stack.size() - 2;
        if (i > 0 && stack[i - 1].length < stack[i + 1].length) --i;
        detail::merge_runs(first, stack, i, comp);
    }
}

template<typename Container, typename Compare>
void timsort(Container& c, Compare comp) {
    timsort(std::begin(c), std::end(c), comp);
}

}  // namespace cadence::util
