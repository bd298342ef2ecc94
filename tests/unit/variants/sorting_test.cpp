#include <gtest/gtest.h>
#include <algorithm>
#include <functional>
#include <memory>
#include <random>
#include <string>
#include <vector>
#include "switchyard/core/registry.h"
#include "switchyard/variants/sorting.h"

using namespace switchyard::core;
using namespace switchyard::variants;

namespace {

std::vector<int> randomValues(std::size_t size, unsigned seed) {
    std::mt19937 gen(seed);
    std::uniform_int_distribution<int> dis(-1000, 1000);
    std::vector<int> values(size);
    std::generate(values.begin(), values.end(), [&]() { return dis(gen); });
    return values;
}

} // namespace

class SortingTest : public ::testing::TestWithParam<std::string> {
protected:
    void SetUp() override {
        registerSortingVariants(registry_);
    }

    std::unique_ptr<SortCapability> make(const Options& options = Options()) {
        return registry_.create(GetParam(), options);
    }

    Registry<SortCapability> registry_;
};

TEST_P(SortingTest, SortsSmallExample) {
    EXPECT_EQ(make()->perform({4, 2, 7, 1}), (std::vector<int>{1, 2, 4, 7}));
}

TEST_P(SortingTest, HandlesEmptyAndSingleElement) {
    auto sorter = make();
    EXPECT_TRUE(sorter->perform({}).empty());
    EXPECT_EQ(sorter->perform({5}), std::vector<int>{5});
}

TEST_P(SortingTest, HandlesDuplicatesAndSortedInputs) {
    auto sorter = make();
    EXPECT_EQ(sorter->perform({3, 1, 3, 1, 3}), (std::vector<int>{1, 1, 3, 3, 3}));
    EXPECT_EQ(sorter->perform({1, 2, 3, 4}), (std::vector<int>{1, 2, 3, 4}));
    EXPECT_EQ(sorter->perform({4, 3, 2, 1}), (std::vector<int>{1, 2, 3, 4}));
    EXPECT_EQ(sorter->perform({9, 9, 9}), (std::vector<int>{9, 9, 9}));
}

TEST_P(SortingTest, MatchesStandardSortOnRandomInput) {
    auto sorter = make();
    for (unsigned seed = 0; seed < 5; ++seed) {
        auto values = randomValues(500, seed);
        auto expected = values;
        std::sort(expected.begin(), expected.end());
        EXPECT_EQ(sorter->perform(values), expected) << "seed " << seed;
    }
}

TEST_P(SortingTest, DescendingOption) {
    auto sorter = make(Options().with("descending", true));
    auto values = randomValues(200, 42);
    auto expected = values;
    std::sort(expected.begin(), expected.end(), std::greater<int>());
    EXPECT_EQ(sorter->perform(values), expected);
}

TEST_P(SortingTest, LeavesInputUntouched) {
    const std::vector<int> input{5, 3, 9, 1};
    make()->perform(input);
    EXPECT_EQ(input, (std::vector<int>{5, 3, 9, 1}));
}

TEST_P(SortingTest, NameMatchesRegistryKey) {
    EXPECT_EQ(make()->name(), GetParam());
}

INSTANTIATE_TEST_SUITE_P(AllVariants, SortingTest,
                         ::testing::Values("quick", "merge", "insertion"));

TEST(MergeSortTest, CutoffOption) {
    MergeSort defaults;
    EXPECT_EQ(defaults.cutoff(), MergeSort::kDefaultCutoff);

    MergeSort tiny(Options().with("cutoff", 1));
    EXPECT_EQ(tiny.cutoff(), 1u);

    auto values = randomValues(300, 7);
    auto expected = values;
    std::sort(expected.begin(), expected.end());
    EXPECT_EQ(tiny.perform(values), expected);
}

TEST(MergeSortTest, InvalidCutoffFailsConstruction) {
    EXPECT_THROW(MergeSort(Options().with("cutoff", 0)), ConfigurationError);
    EXPECT_THROW(MergeSort(Options().with("cutoff", 1.5)), ConfigurationError);

    Registry<SortCapability> registry;
    registerSortingVariants(registry);
    try {
        registry.create("merge", Options().with("cutoff", -3));
        FAIL() << "expected ConstructionError";
    } catch (const ConstructionError& e) {
        EXPECT_EQ(e.key(), "merge");
        EXPECT_THROW(std::rethrow_exception(e.cause()), ConfigurationError);
    }
}

TEST(SortingRegistrationTest, RegistersAllKeysInOrder) {
    Registry<SortCapability> registry;
    registerSortingVariants(registry);
    EXPECT_EQ(registry.listKeys(), (std::vector<std::string>{"quick", "merge", "insertion"}));
}
