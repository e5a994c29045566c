#pragma once

#include <chartgeom/Series.hpp>

namespace chartgeom{

enum class TrendDirection{
    Uptrend,
    Downtrend,
    Sideways,
};

const char *to_string(TrendDirection direction);

struct TrendParams{
    size_t period{20};
    double min_r_squared{0.3};  //weaker fits carry no direction
    double slope_threshold{0.05}; //move over @period relative to the mean
};

/*
    Fits the trailing @period samples. Anything that prevents a confident fit
    (short series, sparse window, failed fit, low r2) is Sideways.
*/
TrendDirection classify(const Series &values, size_t period = 20);
TrendDirection classify(const Series &values, const TrendParams &params);

}
