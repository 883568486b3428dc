#include <gtest/gtest.h>
#include "genjob/common/slot_value.hpp"
#include "genjob/common/slot_value.inline.hpp"
#include <string>

using namespace genjob;

// =============================================================================
// SlotValue Basic Functionality Tests
// =============================================================================

class SlotValueTests : public ::testing::Test
{
protected:
    SlotValue empty;
};

TEST_F(SlotValueTests, DefaultConstructed_IsEmpty)
{
    EXPECT_FALSE(empty.has_value());
    EXPECT_FALSE(static_cast<bool>(empty));
    EXPECT_EQ(empty.type(), std::type_index{typeid(void)});
}

TEST_F(SlotValueTests, Of_HoldsValueAndType)
{
    auto value = SlotValue::of(42);
    EXPECT_TRUE(value.has_value());
    EXPECT_TRUE(value.has_type<int>());
    EXPECT_FALSE(value.has_type<double>());
    EXPECT_EQ(value.as<int>(), 42);
}

TEST_F(SlotValueTests, Of_DecaysConstReference)
{
    const std::string text = "hello";
    auto value = SlotValue::of(text);
    EXPECT_TRUE(value.has_type<std::string>());
    EXPECT_EQ(value.as<std::string>(), "hello");
}

TEST_F(SlotValueTests, As_EmptyThrows)
{
    EXPECT_THROW((void)empty.as<int>(), SlotValueEmptyError);
}

TEST_F(SlotValueTests, As_WrongTypeThrows)
{
    auto value = SlotValue::of(1.5);
    EXPECT_THROW((void)value.as<int>(), SlotValueTypeError);
}

TEST_F(SlotValueTests, TryAs_ReturnsNullptrOnMismatchOrEmpty)
{
    auto value = SlotValue::of(7);
    EXPECT_EQ(value.try_as<double>(), nullptr);
    EXPECT_EQ(empty.try_as<int>(), nullptr);
    ASSERT_NE(value.try_as<int>(), nullptr);
    EXPECT_EQ(*value.try_as<int>(), 7);
}

TEST_F(SlotValueTests, Copies_ShareTheSameObject)
{
    auto value = SlotValue::of(std::vector<int>{1, 2, 3});
    SlotValue copy = value;
    EXPECT_EQ(&copy.as<std::vector<int>>(), &value.as<std::vector<int>>());
}

TEST_F(SlotValueTests, Reset_MakesEmpty)
{
    auto value = SlotValue::of(1);
    auto copy = value;
    value.reset();
    EXPECT_FALSE(value.has_value());
    EXPECT_EQ(copy.as<int>(), 1);
}
