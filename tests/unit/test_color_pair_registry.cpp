#include <gtest/gtest.h>
#include "terminal/ColorPairRegistry.h"
#include <vector>

namespace ViewPane::Terminal {
namespace Tests {

class ColorPairRegistryTest : public ::testing::Test {
protected:
    ColorPairRegistry registry;
};

// ============================================================================
// Allocation
// ============================================================================

TEST_F(ColorPairRegistryTest, StartsEmpty) {
    EXPECT_TRUE(registry.Empty());
    EXPECT_EQ(registry.Size(), 0);
    EXPECT_EQ(registry.GetMaxPairs(), ColorPairRegistry::kDefaultMaxPairs);
}

TEST_F(ColorPairRegistryTest, SlotsFollowSubmissionOrder) {
    EXPECT_EQ(registry.Resolve({1, 4}), 1);
    EXPECT_EQ(registry.Resolve({2, kDefaultColor}), 2);
    EXPECT_EQ(registry.Resolve({kDefaultColor, 3}), 3);
    EXPECT_EQ(registry.Size(), 3);
}

TEST_F(ColorPairRegistryTest, SamePairReusesSlot) {
    int first = registry.Resolve({1, 4});
    registry.Resolve({2, 0});
    int again = registry.Resolve({1, 4});

    EXPECT_EQ(first, again);
    EXPECT_EQ(registry.Size(), 2);
}

TEST_F(ColorPairRegistryTest, ForegroundAndBackgroundAreDistinct) {
    int a = registry.Resolve({1, 2});
    int b = registry.Resolve({2, 1});
    EXPECT_NE(a, b);
}

TEST_F(ColorPairRegistryTest, DefaultPairGetsItsOwnSlot) {
    // Slot 0 is never handed out, even for (default, default)
    EXPECT_EQ(registry.Resolve(ColorPair{}), 1);
}

TEST_F(ColorPairRegistryTest, AllocationCallbackFiresOncePerNewSlot) {
    std::vector<std::pair<int, ColorPair>> allocated;
    registry.SetAllocationCallback([&allocated](int slot, const ColorPair& pair) {
        allocated.emplace_back(slot, pair);
    });

    registry.Resolve({1, 4});
    registry.Resolve({1, 4});
    registry.Resolve({3, kDefaultColor});

    ASSERT_EQ(allocated.size(), 2u);
    EXPECT_EQ(allocated[0].first, 1);
    EXPECT_EQ(allocated[0].second, (ColorPair{1, 4}));
    EXPECT_EQ(allocated[1].first, 2);
    EXPECT_EQ(allocated[1].second, (ColorPair{3, kDefaultColor}));
}

// ============================================================================
// Lookup
// ============================================================================

TEST_F(ColorPairRegistryTest, LookupSlotZeroIsDefaultPair) {
    auto pair = registry.Lookup(0);
    ASSERT_TRUE(pair.has_value());
    EXPECT_EQ(pair->foreground, kDefaultColor);
    EXPECT_EQ(pair->background, kDefaultColor);
}

TEST_F(ColorPairRegistryTest, LookupReturnsRegisteredPair) {
    registry.Resolve({1, 4});
    int slot = registry.Resolve({200, 17});

    auto pair = registry.Lookup(slot);
    ASSERT_TRUE(pair.has_value());
    EXPECT_EQ(*pair, (ColorPair{200, 17}));
}

TEST_F(ColorPairRegistryTest, LookupOutOfRange) {
    registry.Resolve({1, 4});
    EXPECT_FALSE(registry.Lookup(2).has_value());
    EXPECT_FALSE(registry.Lookup(-1).has_value());
}

TEST_F(ColorPairRegistryTest, FindDoesNotAllocate) {
    EXPECT_FALSE(registry.Find({1, 4}).has_value());
    EXPECT_TRUE(registry.Empty());

    registry.Resolve({1, 4});
    auto slot = registry.Find({1, 4});
    ASSERT_TRUE(slot.has_value());
    EXPECT_EQ(*slot, 1);
}

// ============================================================================
// Capacity
// ============================================================================

TEST_F(ColorPairRegistryTest, OverflowThrowsAndLeavesRegistryUnchanged) {
    ColorPairRegistry small(2);
    int callbacks = 0;
    small.SetAllocationCallback([&callbacks](int, const ColorPair&) { ++callbacks; });

    small.Resolve({1, 0});
    small.Resolve({2, 0});

    try {
        small.Resolve({3, 0});
        FAIL() << "Expected ColorPairCapacityError";
    } catch (const ColorPairCapacityError& e) {
        EXPECT_EQ(e.GetMaxPairs(), 2);
        EXPECT_EQ(e.GetPair(), (ColorPair{3, 0}));
    }

    EXPECT_EQ(small.Size(), 2);
    EXPECT_EQ(callbacks, 2);
    EXPECT_FALSE(small.Find({3, 0}).has_value());

    // Known pairs still resolve at capacity
    EXPECT_EQ(small.Resolve({2, 0}), 2);
}

TEST_F(ColorPairRegistryTest, ZeroCapacityRefusesEverything) {
    ColorPairRegistry none(0);
    EXPECT_THROW(none.Resolve({1, 0}), ColorPairCapacityError);
    EXPECT_TRUE(none.Empty());
}

TEST_F(ColorPairRegistryTest, NegativeCapacityTreatedAsZero) {
    ColorPairRegistry none(-5);
    EXPECT_EQ(none.GetMaxPairs(), 0);
}

TEST_F(ColorPairRegistryTest, LimitNeverExceedsEightBitSlots) {
    ColorPairRegistry large(32767);
    EXPECT_EQ(large.GetMaxPairs(), ColorPairRegistry::kMaxPairsLimit);

    for (int i = 0; i < 255; ++i) {
        large.Resolve({i, kDefaultColor});
    }
    EXPECT_EQ(large.Size(), 255);
    EXPECT_THROW(large.Resolve({255, kDefaultColor}), ColorPairCapacityError);
    EXPECT_EQ(*large.Find({254, kDefaultColor}), 255);
    EXPECT_FALSE(large.Find({255, kDefaultColor}).has_value());

    registry.SetMaxPairs(1000);
    EXPECT_EQ(registry.GetMaxPairs(), 255);
}

TEST_F(ColorPairRegistryTest, LoweringLimitKeepsExistingSlots) {
    registry.Resolve({1, 0});
    registry.Resolve({2, 0});
    registry.SetMaxPairs(1);

    EXPECT_EQ(registry.Resolve({2, 0}), 2);
    EXPECT_THROW(registry.Resolve({3, 0}), ColorPairCapacityError);
}

} // namespace Tests
} // namespace ViewPane::Terminal
