#pragma once

#include <vector>

#include <chartgeom/Series.hpp>

namespace chartgeom{

struct SupportResistance{
    std::vector<double> support;
    std::vector<double> resistance;
};

struct LevelParams{
    size_t min_distance{10};
    double prominence_threshold{0.01};
    double tolerance{0.02};
    size_t lookback_period{50}; //accepted, input is not truncated
};

/*
    Greedy single pass over the sorted levels: a level joins the open cluster
    while it is within @tolerance (relative) of the cluster running mean.
    Returns one mean per cluster, ascending.
*/
std::vector<double> cluster(std::vector<double> levels, double tolerance = 0.02);

/* resistance from peaks of @highs, support from troughs of @lows */
SupportResistance locate(const Series &highs, const Series &lows, size_t lookback_period = 50);
SupportResistance locate(const Series &highs, const Series &lows, const LevelParams &params);
SupportResistance locate(const PriceFrame &frame, const LevelParams &params = LevelParams{});

}
