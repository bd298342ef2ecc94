#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "switchyard/core/context.h"
#include "switchyard/core/function_capability.h"

using namespace switchyard::core;
using ::testing::Return;
using ::testing::Throw;

namespace {

using Transform = Capability<int, int>;
using TransformContext = Context<int, int>;

class MockTransform : public Transform {
public:
    MOCK_METHOD(std::string, name, (), (const, override));
    MOCK_METHOD(int, perform, (const int&), (override));
};

class Scale : public Transform {
public:
    explicit Scale(const Options& options) : factor_(options.get<int>("factor", 1)) {}

    std::string name() const override { return "scale"; }
    int perform(const int& input) override { return input * factor_; }

private:
    int factor_;
};

class Offset : public Transform {
public:
    explicit Offset(int offset) : offset_(offset) {}

    std::string name() const override { return "offset"; }
    int perform(const int& input) override { return input + offset_; }

private:
    int offset_;
};

} // namespace

class ContextTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry_.registerType<Scale>("scale");
        registry_.registerCreator("strict", [](const Options& options) -> std::unique_ptr<Transform> {
            if (options.get<int>("factor", 1) < 0) {
                throw std::invalid_argument("negative factor");
            }
            return std::make_unique<Scale>(options);
        });
    }

    Registry<Transform> registry_;
    TransformContext context_;
};

TEST_F(ContextTest, FreshContextRefusesToExecute) {
    EXPECT_FALSE(context_.hasStrategy());
    EXPECT_THROW(context_.execute(1), NoStrategySelectedError);
    EXPECT_THROW(context_.strategyName(), NoStrategySelectedError);

    // Failing does not change the state
    EXPECT_FALSE(context_.hasStrategy());
}

TEST_F(ContextTest, ExecuteDelegatesToSelectedStrategy) {
    auto mock = std::make_shared<MockTransform>();
    EXPECT_CALL(*mock, perform(3)).WillOnce(Return(9));
    EXPECT_CALL(*mock, name()).WillRepeatedly(Return("mock"));

    context_.setStrategy(mock);

    EXPECT_TRUE(context_.hasStrategy());
    EXPECT_EQ(context_.execute(3), 9);
    EXPECT_EQ(context_.strategyName(), "mock");
}

TEST_F(ContextTest, ReselectionRoutesOnlyToNewStrategy) {
    auto first = std::make_shared<MockTransform>();
    auto second = std::make_shared<MockTransform>();
    EXPECT_CALL(*first, name()).WillRepeatedly(Return("first"));
    EXPECT_CALL(*second, name()).WillRepeatedly(Return("second"));
    EXPECT_CALL(*first, perform(::testing::_)).Times(1).WillOnce(Return(1));
    EXPECT_CALL(*second, perform(::testing::_)).Times(3).WillRepeatedly(Return(2));

    context_.setStrategy(first);
    EXPECT_EQ(context_.execute(0), 1);

    context_.setStrategy(second);
    EXPECT_EQ(context_.execute(0), 2);
    EXPECT_EQ(context_.execute(5), 2);
    EXPECT_EQ(context_.execute(7), 2);
}

TEST_F(ContextTest, StrategyFailurePropagatesAndContextStaysReady) {
    auto mock = std::make_shared<MockTransform>();
    EXPECT_CALL(*mock, name()).WillRepeatedly(Return("flaky"));
    EXPECT_CALL(*mock, perform(::testing::_))
        .WillOnce(Throw(std::runtime_error("boom")))
        .WillOnce(Return(4));

    context_.setStrategy(mock);

    // The variant's own error is not turned into NoStrategySelectedError
    EXPECT_THROW(context_.execute(1), std::runtime_error);
    EXPECT_TRUE(context_.hasStrategy());
    EXPECT_EQ(context_.execute(1), 4);
}

TEST_F(ContextTest, NullStrategyIsRejected) {
    EXPECT_THROW(context_.setStrategy(nullptr), std::invalid_argument);
    EXPECT_FALSE(context_.hasStrategy());
}

TEST_F(ContextTest, AcceptsRegistryProducedAndHandBuiltStrategies) {
    context_.setStrategy(registry_.create("scale", Options().with("factor", 3)));
    EXPECT_EQ(context_.execute(2), 6);

    context_.setStrategy(std::make_shared<Offset>(10));
    EXPECT_EQ(context_.execute(2), 12);
    EXPECT_FALSE(context_.sourceKey().has_value());
}

TEST_F(ContextTest, ConstructorInjectionSelectsStrategy) {
    TransformContext injected(std::make_shared<Offset>(1));
    EXPECT_TRUE(injected.hasStrategy());
    EXPECT_EQ(injected.execute(1), 2);
}

TEST_F(ContextTest, SelectFromUsesContextConfiguration) {
    context_.setConfiguration(Options().with("factor", 4));
    context_.selectFrom(registry_, "scale");

    EXPECT_EQ(context_.execute(5), 20);
    EXPECT_EQ(context_.sourceKey(), std::optional<std::string>("scale"));
}

TEST_F(ContextTest, SetConfigurationRebuildsRegistrySelectedStrategy) {
    context_.selectFrom(registry_, "scale");
    EXPECT_EQ(context_.execute(5), 5);

    context_.setConfiguration(Options().with("factor", 2));
    EXPECT_EQ(context_.execute(5), 10);
    EXPECT_EQ(context_.configuration().get<int>("factor", 0), 2);
}

TEST_F(ContextTest, SetConfigurationLeavesHandBuiltStrategyAlone) {
    context_.setStrategy(std::make_shared<Offset>(1));
    context_.setConfiguration(Options().with("factor", 7));

    EXPECT_EQ(context_.execute(1), 2);

    // Applied on the next registry selection
    context_.selectFrom(registry_, "scale");
    EXPECT_EQ(context_.execute(1), 7);
}

TEST_F(ContextTest, FailedRebuildKeepsPreviousStrategyAndConfiguration) {
    context_.setConfiguration(Options().with("factor", 3));
    context_.selectFrom(registry_, "strict");

    EXPECT_THROW(context_.setConfiguration(Options().with("factor", -1)), ConstructionError);
    EXPECT_EQ(context_.execute(2), 6);
    EXPECT_EQ(context_.configuration().get<int>("factor", 0), 3);
}

TEST_F(ContextTest, FailedSelectionKeepsPreviousState) {
    context_.setStrategy(std::make_shared<Offset>(1));

    EXPECT_THROW(context_.selectFrom(registry_, "unknown"), UnknownKeyError);
    EXPECT_EQ(context_.execute(1), 2);

    context_.setConfiguration(Options().with("factor", -5));
    EXPECT_THROW(context_.selectFrom(registry_, "strict"), ConstructionError);
    EXPECT_EQ(context_.strategyName(), "offset");
}

TEST_F(ContextTest, SetStrategyForgetsRegistrySource) {
    context_.selectFrom(registry_, "scale");
    context_.setStrategy(std::make_shared<Offset>(0));

    EXPECT_FALSE(context_.sourceKey().has_value());
    context_.setConfiguration(Options().with("factor", 9));
    EXPECT_EQ(context_.strategyName(), "offset");
}

TEST_F(ContextTest, CreatorMayReadTheContextItBuildsFor) {
    std::vector<int> seenDuringRebuild;
    registry_.registerCreator("observing", [this, &seenDuringRebuild](const Options& options)
                                               -> std::unique_ptr<Transform> {
        if (context_.hasStrategy()) {
            seenDuringRebuild.push_back(context_.execute(10));
            EXPECT_EQ(context_.configuration().get<int>("factor", 1), 2);
        }
        return std::make_unique<Scale>(options);
    });

    context_.setConfiguration(Options().with("factor", 2));
    context_.selectFrom(registry_, "observing");
    context_.setConfiguration(Options().with("factor", 5));

    // The rebuild observed the previous variant and configuration
    EXPECT_EQ(seenDuringRebuild, std::vector<int>{20});
    EXPECT_EQ(context_.execute(10), 50);
    EXPECT_EQ(context_.configuration().get<int>("factor", 0), 5);
}

TEST(FunctionCapabilityTest, ClosuresActAsStrategies) {
    TransformContext context;
    const int captured = 100;
    context.setStrategy(makeFunctionCapability<int, int>("add-captured",
        [captured](const int& input) { return input + captured; }));

    EXPECT_EQ(context.execute(1), 101);
    EXPECT_EQ(context.strategyName(), "add-captured");
}

TEST(FunctionCapabilityTest, NullaryClosure) {
    Context<void, std::string> context;
    context.setStrategy(makeFunctionCapability<void, std::string>("hello", []() {
        return std::string("hello");
    }));
    EXPECT_EQ(context.execute(), "hello");
}

TEST(FunctionCapabilityTest, EmptyCallableIsRejected) {
    EXPECT_THROW((FunctionCapability<int, int>("empty", nullptr)), std::invalid_argument);
}

// Readers keep executing while a writer re-selects
TEST(ContextConcurrencyTest, ExecuteDuringReselection) {
    TransformContext context(std::make_shared<Offset>(1));
    std::atomic<bool> done{false};
    std::atomic<int> unexpected{0};

    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&]() {
            while (!done.load()) {
                const int value = context.execute(0);
                if (value != 1 && value != 2) {
                    ++unexpected;
                }
            }
        });
    }

    for (int i = 0; i < 1000; ++i) {
        context.setStrategy(std::make_shared<Offset>(i % 2 == 0 ? 2 : 1));
    }
    done.store(true);
    for (auto& reader : readers) {
        reader.join();
    }

    EXPECT_EQ(unexpected.load(), 0);
}
