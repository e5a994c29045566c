#include <cmath>
#include <numbers>
#include <sstream>

#include <chartgeom/Analysis.hpp>
#include <chartgeom/Print.hpp>

#include "gtest/gtest.h"

using namespace chartgeom;

namespace{

class AnalysisTest: public ::testing::Test{
public:
    PriceFrame frame{"RAILS"};

    AnalysisTest(){
        bt::ptime t0(boost::gregorian::date(2019, 3, 1), bt::hours(0));
        for(size_t i = 0; i < 60; i++){
            double wave = 2 * std::sin(2 * std::numbers::pi * i / 10.0);
            double high = 100 + 0.5 * i + wave;
            double low = 90 + 0.5 * i + wave;
            frame.push(Bar{t0 + bt::hours(i), low + 4, high, low, low + 6, 100});
        }
    }
};

TEST_F(AnalysisTest, Report){
    auto report = analyze(frame);

    EXPECT_EQ(report.direction, TrendDirection::Uptrend);
    ASSERT_TRUE(report.close_trend.has_value());
    EXPECT_EQ(report.close_trend_error, FitError::None);
    EXPECT_NEAR(report.close_trend->slope, 0.5, 0.1);
    EXPECT_EQ(report.close_trend->end_index, 59);

    EXPECT_EQ(select(report.extrema, ExtremumKind::Peak).size(), 6);
    EXPECT_EQ(select(report.extrema, ExtremumKind::Trough).size(), 6);

    EXPECT_FALSE(report.levels.support.empty());
    EXPECT_FALSE(report.levels.resistance.empty());

    ASSERT_EQ(report.channels.size(), 15);
    EXPECT_EQ(report.channels.front().touches, detect(frame).front().touches);
}

TEST_F(AnalysisTest, Config){
    GeometryConfig config;
    config.channels.min_touches = 1000;
    config.trend.min_r_squared = 1.1;
    auto report = analyze(frame, config);
    EXPECT_TRUE(report.channels.empty());
    EXPECT_EQ(report.direction, TrendDirection::Sideways);
}

TEST(AnalysisEmptyTest, EmptyFrame){
    auto report = analyze(PriceFrame{"EMPTY"});
    EXPECT_EQ(report.direction, TrendDirection::Sideways);
    EXPECT_FALSE(report.close_trend.has_value());
    EXPECT_EQ(report.close_trend_error, FitError::InvalidRange);
    EXPECT_TRUE(report.extrema.empty());
    EXPECT_TRUE(report.channels.empty());
}

TEST_F(AnalysisTest, Print){
    auto report = analyze(frame);
    std::stringstream ss;
    print_report(ss, frame, report, 2);
    auto text = ss.str();
    EXPECT_NE(text.find("RAILS 60 bars"), std::string::npos);
    EXPECT_NE(text.find("Trend: uptrend"), std::string::npos);
    EXPECT_NE(text.find("2019-Mar-01 03:00:00 peak 3"), std::string::npos);
    EXPECT_NE(text.find("Channels: 15"), std::string::npos);
    /* level printing leaves the precision of the channel lines alone */
    EXPECT_NE(text.find("upper (3 103.402)->(13 108.402) slope 0.5"), std::string::npos);
    EXPECT_NE(text.find("touches 68 width 11.8042"), std::string::npos);
    EXPECT_EQ(text.find("e+02"), std::string::npos);

    std::stringstream full;
    full << report;
    EXPECT_NE(full.str().find("touches 68"), std::string::npos);
}

}
