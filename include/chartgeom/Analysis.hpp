#pragma once

#include <optional>
#include <vector>

#include <chartgeom/Series.hpp>
#include <chartgeom/LinearRegression.hpp>
#include <chartgeom/Extremums.hpp>
#include <chartgeom/Levels.hpp>
#include <chartgeom/TrendDirection.hpp>
#include <chartgeom/Channels.hpp>

namespace chartgeom{

/* every tunable of the engine, defaults match the free functions */
struct GeometryConfig{
    ExtremaParams extrema{};
    LevelParams levels{};
    TrendParams trend{};
    ChannelParams channels{};
};

struct GeometryReport{
    TrendDirection direction{TrendDirection::Sideways};
    std::optional<TrendLine> close_trend; //whole series fit of closes
    FitError close_trend_error{FitError::None};
    std::vector<PeakTrough> extrema; //of closes
    SupportResistance levels;
    std::vector<Channel> channels;
};

GeometryReport analyze(const PriceFrame &frame, const GeometryConfig &config = GeometryConfig{});

}
