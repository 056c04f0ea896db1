#include <gtest/gtest.h>

#include "scale_factors.hpp"

#include <limits>

using namespace scale_factors;

TEST(ScaleFactorsTest, WindowScaleFormula) {
    EXPECT_EQ(window_scale(1.7), 2);
    EXPECT_EQ(window_scale(1.75), 2);
    EXPECT_EQ(window_scale(1.5), 1);
    EXPECT_EQ(window_scale(1.0), 1);
    EXPECT_EQ(window_scale(2.0), 2);
    EXPECT_EQ(window_scale(2.5), 2);
    EXPECT_EQ(window_scale(2.75), 3);
    EXPECT_EQ(window_scale(0.5), 1);
    EXPECT_EQ(window_scale(0.1), 1);
}

TEST(ScaleFactorsTest, CursorSizeFollowsFactor) {
    EXPECT_EQ(cursor_size(1.0), 24);
    EXPECT_EQ(cursor_size(1.25), 30);
    EXPECT_EQ(cursor_size(2.0), 48);
}

TEST(ScaleFactorsTest, SingleFactorSelection) {
    EXPECT_DOUBLE_EQ(single_factor({}), 1.0);
    EXPECT_DOUBLE_EQ(single_factor({{"eDP-1", 1.5}}), 1.5);
    EXPECT_DOUBLE_EQ(single_factor({{"eDP-1", 1.5}, {"ALL", 1.25}}), 1.25);
    EXPECT_DOUBLE_EQ(single_factor({{"eDP-1", 1.5}, {"HDMI-1", 2.0}}), 1.0);
}

TEST(ScaleFactorsTest, JoinFormatsTwoDecimalsInNameOrder) {
    EXPECT_EQ(join({{"eDP-1", 1.5}, {"DP-2", 2}}), "DP-2=2.00;eDP-1=1.50");
    EXPECT_EQ(join({}), "");
}

TEST(ScaleFactorsTest, ParseSkipsMalformedPairs) {
    auto f = parse("eDP-1=1.25;garbage;HDMI-1=abc;DP-2=2;;=3");
    ASSERT_EQ(f.size(), 3u);
    EXPECT_DOUBLE_EQ(f["eDP-1"], 1.25);
    EXPECT_DOUBLE_EQ(f["DP-2"], 2.0);
    EXPECT_DOUBLE_EQ(f[""], 3.0);
    EXPECT_TRUE(parse("").empty());
}

TEST(ScaleFactorsTest, ParseReadsWhatJoinWrites) {
    FactorMap in{{"eDP-1", 1.25}, {"HDMI-1", 1.75}};
    EXPECT_EQ(parse(join(in)), in);
}

TEST(ScaleFactorsTest, SingleToMapUsesAllKey) {
    auto m = single_to_map(1.5);
    ASSERT_EQ(m.size(), 1u);
    EXPECT_DOUBLE_EQ(m.at("ALL"), 1.5);
}

TEST(ScaleFactorsTest, HugeFactorsSaturateInsteadOfOverflowing) {
    EXPECT_EQ(window_scale(1e300), std::numeric_limits<int>::max());
    EXPECT_EQ(window_scale(std::numeric_limits<double>::infinity()), std::numeric_limits<int>::max());
    EXPECT_EQ(cursor_size(1e300), std::numeric_limits<int>::max());
    EXPECT_EQ(cursor_size(1e8), std::numeric_limits<int>::max());
    EXPECT_EQ(cursor_size(1e7), 240000000);
}
