#pragma once

#include "switchyard/core/capability.h"
#include "switchyard/core/options.h"
#include "switchyard/core/registry.h"
#include <cstddef>
#include <string>
#include <vector>

namespace switchyard {
namespace variants {

/// Sorts a sequence of integers and returns the sorted copy.
using SortCapability = core::Capability<std::vector<int>, std::vector<int>>;

/**
 * @brief Options shared by every sorting variant.
 *
 * Recognised option: "descending" (bool, default false).
 */
struct SortOrder {
    bool descending{false};

    static SortOrder fromOptions(const core::Options& options);
};

/**
 * @brief Quicksort with median-of-three pivot selection.
 */
class QuickSort : public SortCapability {
public:
    explicit QuickSort(const core::Options& options = core::Options());

    std::string name() const override { return "quick"; }
    std::vector<int> perform(const std::vector<int>& input) override;

private:
    SortOrder order_;
};

/**
 * @brief Stable top-down merge sort.
 *
 * Runs shorter than "cutoff" elements (int >= 1, default 16) are
 * insertion-sorted instead of split further.
 */
class MergeSort : public SortCapability {
public:
    static constexpr std::size_t kDefaultCutoff = 16;

    explicit MergeSort(const core::Options& options = core::Options());

    std::string name() const override { return "merge"; }
    std::vector<int> perform(const std::vector<int>& input) override;

    std::size_t cutoff() const { return cutoff_; }

private:
    SortOrder order_;
    std::size_t cutoff_;
};

class InsertionSort : public SortCapability {
public:
    explicit InsertionSort(const core::Options& options = core::Options());

    std::string name() const override { return "insertion"; }
    std::vector<int> perform(const std::vector<int>& input) override;

private:
    SortOrder order_;
};

/// Registers "quick", "merge" and "insertion".
void registerSortingVariants(core::Registry<SortCapability>& registry);

} // namespace variants
} // namespace switchyard
