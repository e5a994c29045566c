#include <cmath>
#include <numbers>

#include <chartgeom/Channels.hpp>

#include "gtest/gtest.h"

using namespace chartgeom;

namespace{

/* rising rails, highs peak at 3 + 10k, lows trough at 7 + 10k */
class ChannelsTest: public ::testing::Test{
public:
    Series highs;
    Series lows;

    static double wave(size_t i){
        return 2 * std::sin(2 * std::numbers::pi * i / 10.0);
    }

    ChannelsTest(){
        for(size_t i = 0; i < 60; i++){
            highs.push_back(100 + 0.5 * i + wave(i));
            lows.push_back(90 + 0.5 * i + wave(i));
        }
    }
};

TEST_F(ChannelsTest, ParallelRails){
    auto channels = detect(highs, lows, 3);
    ASSERT_FALSE(channels.empty());

    for(const auto &c: channels){
        EXPECT_NEAR(c.upper_line.slope, 0.5, 0.5 * 0.3);
        EXPECT_NEAR(c.lower_line.slope, 0.5, 0.5 * 0.3);
        EXPECT_GE(c.touches, 4);
        EXPECT_GE(c.touches, 3);
        EXPECT_LT(c.upper_line.start.first, c.upper_line.end.first);
        EXPECT_LT(c.lower_line.start.first, c.lower_line.end.first);
        EXPECT_DOUBLE_EQ(c.width, std::abs(c.upper_line.start.second - c.lower_line.start.second));
    }
    for(size_t i = 1; i < channels.size(); i++){
        EXPECT_GE(channels[i - 1].touches, channels[i].touches);
    }
}

TEST_F(ChannelsTest, OneChannelPerPeakPair){
    /* 6 peaks, every pair has a parallel trough pair */
    auto channels = detect(highs, lows, 3);
    EXPECT_EQ(channels.size(), 15);
}

TEST_F(ChannelsTest, MinTouches){
    auto all = detect(highs, lows, 4);
    EXPECT_EQ(all.size(), detect(highs, lows, 3).size());
    EXPECT_TRUE(detect(highs, lows, 1000).empty());

    auto strict = detect(highs, lows, all.front().touches);
    ASSERT_FALSE(strict.empty());
    for(const auto &c: strict){
        EXPECT_EQ(c.touches, all.front().touches);
    }
}

TEST_F(ChannelsTest, Deterministic){
    auto first = detect(highs, lows, 3);
    auto second = detect(highs, lows, 3);
    ASSERT_EQ(first.size(), second.size());
    for(size_t i = 0; i < first.size(); i++){
        EXPECT_EQ(first[i].upper_line.start, second[i].upper_line.start);
        EXPECT_EQ(first[i].lower_line.start, second[i].lower_line.start);
        EXPECT_EQ(first[i].lower_line.end, second[i].lower_line.end);
        EXPECT_EQ(first[i].touches, second[i].touches);
    }
}

TEST_F(ChannelsTest, DivergingRails){
    Series falling;
    for(size_t i = 0; i < 60; i++){
        falling.push_back(90 - 0.5 * i + wave(i));
    }
    EXPECT_TRUE(detect(highs, falling, 3).empty());
}

TEST_F(ChannelsTest, SlopeTolerance){
    ChannelParams params;
    params.slope_tolerance = 0.0;
    EXPECT_TRUE(detect(highs, lows, params).empty());
}

TEST(ChannelsTieTest, FirstTroughPairWins){
    /* flat rails: peaks at 2, 38 and troughs at 8, 20, 32 give 9 touches for every trough pair */
    Series highs(40, 100.0);
    Series lows(40, 90.0);
    highs[2] = 110;
    highs[38] = 110;
    lows[8] = 80;
    lows[20] = 80;
    lows[32] = 80;

    auto channels = detect(highs, lows, 3);
    ASSERT_EQ(channels.size(), 1);
    EXPECT_EQ(channels[0].touches, 9);
    EXPECT_EQ(channels[0].upper_line.start.first, 2);
    EXPECT_EQ(channels[0].upper_line.end.first, 38);
    EXPECT_EQ(channels[0].lower_line.start.first, 8);
    EXPECT_EQ(channels[0].lower_line.end.first, 20);
    EXPECT_DOUBLE_EQ(channels[0].width, 30.0);
}

TEST(ChannelsEdgeTest, NotEnoughExtrema){
    Series rising;
    for(size_t i = 0; i < 30; i++){
        rising.push_back(100.0 + i);
    }
    EXPECT_TRUE(detect(rising, rising, 3).empty());
    EXPECT_TRUE(detect(Series{}, Series{}, 3).empty());
}

TEST(CountTouchesTest, EveryBarOnTheLines){
    Series highs;
    Series lows;
    for(size_t i = 0; i <= 10; i++){
        highs.push_back(110.0 + i);
        lows.push_back(100.0 + i);
    }
    PeakTrough p1{2, 112, ExtremumKind::Peak, 1};
    PeakTrough p2{8, 118, ExtremumKind::Peak, 1};
    PeakTrough t1{3, 103, ExtremumKind::Trough, 1};
    PeakTrough t2{7, 107, ExtremumKind::Trough, 1};
    /* bars 2..8 touch both lines */
    EXPECT_EQ(count_touches(highs, lows, p1, p2, t1, t2), 4 + 7 * 2);
}

TEST(CountTouchesTest, ToleranceAndNulls){
    Series highs;
    Series lows;
    for(size_t i = 0; i <= 10; i++){
        highs.push_back(110.0 + i);
        lows.push_back(100.0 + i);
    }
    highs[4] = 114 * 1.03;
    lows[5] = std::nullopt;
    PeakTrough p1{2, 112, ExtremumKind::Peak, 1};
    PeakTrough p2{8, 118, ExtremumKind::Peak, 1};
    PeakTrough t1{3, 103, ExtremumKind::Trough, 1};
    PeakTrough t2{7, 107, ExtremumKind::Trough, 1};
    /* bar 4 only touches the lower line, bar 5 is skipped */
    EXPECT_EQ(count_touches(highs, lows, p1, p2, t1, t2), 4 + 5 * 2 + 1);
    EXPECT_EQ(count_touches(highs, lows, p1, p2, t1, t2, 0.05), 4 + 6 * 2);
}

TEST(CountTouchesTest, ZeroLineIsNoTouch){
    Series highs(5, 0.0);
    Series lows(5, 0.0);
    PeakTrough p1{1, 0, ExtremumKind::Peak, 1};
    PeakTrough p2{3, 0, ExtremumKind::Peak, 1};
    PeakTrough t1{1, 0, ExtremumKind::Trough, 1};
    PeakTrough t2{3, 0, ExtremumKind::Trough, 1};
    EXPECT_EQ(count_touches(highs, lows, p1, p2, t1, t2), 4);
}

TEST(CountTouchesTest, LinesBelowZero){
    /* both lines fall below zero inside [10, 25], every bar under a negative line touches */
    Series highs(30, 50.0);
    Series lows(30, 40.0);
    PeakTrough p1{10, 100, ExtremumKind::Peak, 1};
    PeakTrough p2{15, 60, ExtremumKind::Peak, 1};
    PeakTrough t1{20, 10, ExtremumKind::Trough, 1};
    PeakTrough t2{25, -30, ExtremumKind::Trough, 1};
    /* upper is negative on 23..25, lower on 22..25 */
    EXPECT_EQ(count_touches(highs, lows, p1, p2, t1, t2), 4 + 3 + 4);
}

TEST(ChannelLineTest, ValueAt){
    ChannelLine line{{2, 112.0}, {8, 118.0}, 1.0};
    EXPECT_DOUBLE_EQ(line.intercept(), 110.0);
    EXPECT_DOUBLE_EQ(line.value_at(10), 120.0);
}

}
