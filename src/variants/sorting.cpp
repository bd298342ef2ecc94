#include "switchyard/variants/sorting.h"
#include "switchyard/core/errors.h"
#include <algorithm>
#include <functional>
#include <string>
#include <utility>

namespace switchyard {
namespace variants {

namespace {

using Iter = std::vector<int>::iterator;

template <typename Compare>
void insertionSort(Iter first, Iter last, Compare comp) {
    if (first == last) {
        return;
    }
    for (Iter i = first + 1; i != last; ++i) {
        int value = *i;
        Iter j = i;
        while (j != first && comp(value, *(j - 1))) {
            *j = *(j - 1);
            --j;
        }
        *j = value;
    }
}

using Index = std::ptrdiff_t;

template <typename Compare>
int medianOfThree(int a, int b, int c, Compare comp) {
    if (comp(a, b)) {
        if (comp(b, c)) return b;
        return comp(a, c) ? c : a;
    }
    if (comp(a, c)) return a;
    return comp(b, c) ? c : b;
}

// Hoare partition of values[lo..hi]; returns the last index of the left part.
template <typename Compare>
Index hoarePartition(std::vector<int>& values, Index lo, Index hi, Compare comp) {
    const int pivot = medianOfThree(values[lo], values[lo + (hi - lo) / 2], values[hi], comp);

    Index i = lo - 1;
    Index j = hi + 1;
    while (true) {
        do { ++i; } while (comp(values[i], pivot));
        do { --j; } while (comp(pivot, values[j]));
        if (i >= j) {
            return j;
        }
        std::swap(values[i], values[j]);
    }
}

template <typename Compare>
void quickSort(std::vector<int>& values, Index lo, Index hi, Compare comp) {
    // Recurse into the smaller part, loop on the larger one.
    while (lo < hi) {
        const Index split = hoarePartition(values, lo, hi, comp);
        if (split - lo < hi - split) {
            quickSort(values, lo, split, comp);
            lo = split + 1;
        } else {
            quickSort(values, split + 1, hi, comp);
            hi = split;
        }
    }
}

template <typename Compare>
void mergeSort(Iter first, Iter last, std::vector<int>& buffer, std::size_t cutoff, Compare comp) {
    const auto length = static_cast<std::size_t>(last - first);
    if (length <= cutoff || length < 2) {
        insertionSort(first, last, comp);
        return;
    }

    Iter mid = first + static_cast<std::ptrdiff_t>(length / 2);
    mergeSort(first, mid, buffer, cutoff, comp);
    mergeSort(mid, last, buffer, cutoff, comp);

    buffer.clear();
    Iter left = first;
    Iter right = mid;
    while (left != mid && right != last) {
        // Taking from the left on ties keeps the sort stable.
        if (comp(*right, *left)) {
            buffer.push_back(*right++);
        } else {
            buffer.push_back(*left++);
        }
    }
    buffer.insert(buffer.end(), left, mid);
    buffer.insert(buffer.end(), right, last);
    std::copy(buffer.begin(), buffer.end(), first);
}

template <typename Sorter>
std::vector<int> sortCopy(const std::vector<int>& input, const SortOrder& order, Sorter sorter) {
    std::vector<int> result(input);
    if (order.descending) {
        sorter(result, std::greater<int>());
    } else {
        sorter(result, std::less<int>());
    }
    return result;
}

} // namespace

SortOrder SortOrder::fromOptions(const core::Options& options) {
    SortOrder order;
    order.descending = options.get<bool>("descending", false);
    return order;
}

QuickSort::QuickSort(const core::Options& options)
    : order_(SortOrder::fromOptions(options)) {}

std::vector<int> QuickSort::perform(const std::vector<int>& input) {
    return sortCopy(input, order_, [](std::vector<int>& values, auto comp) {
        quickSort(values, 0, static_cast<Index>(values.size()) - 1, comp);
    });
}

MergeSort::MergeSort(const core::Options& options)
    : order_(SortOrder::fromOptions(options)), cutoff_(kDefaultCutoff) {
    const int cutoff = options.get<int>("cutoff", static_cast<int>(kDefaultCutoff));
    if (cutoff < 1) {
        throw core::ConfigurationError("cutoff", "must be at least 1, got " + std::to_string(cutoff));
    }
    cutoff_ = static_cast<std::size_t>(cutoff);
}

std::vector<int> MergeSort::perform(const std::vector<int>& input) {
    const std::size_t cutoff = cutoff_;
    return sortCopy(input, order_, [cutoff](std::vector<int>& values, auto comp) {
        std::vector<int> buffer;
        buffer.reserve(values.size());
        mergeSort(values.begin(), values.end(), buffer, cutoff, comp);
    });
}

InsertionSort::InsertionSort(const core::Options& options)
    : order_(SortOrder::fromOptions(options)) {}

std::vector<int> InsertionSort::perform(const std::vector<int>& input) {
    return sortCopy(input, order_, [](std::vector<int>& values, auto comp) {
        insertionSort(values.begin(), values.end(), comp);
    });
}

void registerSortingVariants(core::Registry<SortCapability>& registry) {
    registry.registerType<QuickSort>("quick", "Quicksort, median-of-three pivot");
    registry.registerType<MergeSort>("merge", "Stable merge sort with insertion-sort cutoff");
    registry.registerType<InsertionSort>("insertion", "Insertion sort for short inputs");
}

} // namespace variants
} // namespace switchyard
