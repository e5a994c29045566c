#pragma once

#include <cstdint>
#include <utility>
#include <vector>

#include <chartgeom/Series.hpp>
#include <chartgeom/Extremums.hpp>

namespace chartgeom{

/* line through two defining extrema, points are (index, value) */
struct ChannelLine{
    std::pair<size_t, double> start;
    std::pair<size_t, double> end;
    double slope;

    double intercept() const{
        return start.second - slope * start.first;
    }
    double value_at(size_t index) const{
        return slope * index + intercept();
    }
};

struct Channel{
    ChannelLine upper_line;
    ChannelLine lower_line;
    uint32_t touches; //>= 4, the defining points always count
    double width; //|upper start - lower start|, not the minimal gap
};

struct ChannelParams{
    uint32_t min_touches{3};
    double slope_tolerance{0.3};  //relative to the upper slope
    double touch_tolerance{0.02}; //relative to the line value
    ExtremaParams extrema{};
};

constexpr double SLOPE_EPSILON = 1e-10;
constexpr uint32_t DEFINING_TOUCHES = 4;

/* upper line through p1, p2, lower through t1, t2 */
uint32_t count_touches(const Series &highs, const Series &lows,
        const PeakTrough &p1, const PeakTrough &p2,
        const PeakTrough &t1, const PeakTrough &t2, double tolerance = 0.02);

/*
    Every ascending peak pair of @highs is matched against the ascending trough
    pairs of @lows with a compatible slope, the trough pair with most touches
    wins (first found on ties). Sorted by touches, descending.
*/
std::vector<Channel> detect(const Series &highs, const Series &lows, uint32_t min_touches = 3);
std::vector<Channel> detect(const Series &highs, const Series &lows, const ChannelParams &params);
std::vector<Channel> detect(const PriceFrame &frame, const ChannelParams &params = ChannelParams{});

}
