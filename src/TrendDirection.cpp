#include <cmath>
#include <numeric>

#include <boost/math/special_functions/sign.hpp>
namespace bm = boost::math;

#include <chartgeom/Utils.hpp>
#include <chartgeom/TrendDirection.hpp>
#include <chartgeom/LinearRegression.hpp>

namespace chartgeom{

const char *to_string(TrendDirection direction){
    switch(direction){
        case TrendDirection::Uptrend:
            return "uptrend";
        case TrendDirection::Downtrend:
            return "downtrend";
        case TrendDirection::Sideways:
            return "sideways";
    }
    return "unknown";
}

TrendDirection classify(const Series &values, const TrendParams &params){
    size_t period = params.period;
    if(values.size() < period || period == 0)
        return TrendDirection::Sideways;

    size_t start = values.size() - period;
    auto recent = valid_values(values, start);
    if(recent.size() < period / 2)
        return TrendDirection::Sideways;

    auto result = fit(values, (ssize_t)start, (ssize_t)values.size() - 1);
    if(!result.ok()){
        LOG_WARNING("trend fit over last %zu samples failed: %s", period, to_string(result.error()));
        return TrendDirection::Sideways;
    }
    const auto &line = result.value();
    if(line.r_squared < params.min_r_squared)
        return TrendDirection::Sideways;

    double mean = std::accumulate(recent.begin(), recent.end(), 0.0) / recent.size();
    if(mean == 0)
        return TrendDirection::Sideways;

    double slope_fraction = (line.slope * period) / mean;
    LOG_DEBUG("trend slope fraction %f r2 %f", slope_fraction, line.r_squared);
    if(std::abs(slope_fraction) <= params.slope_threshold)
        return TrendDirection::Sideways;

    return bm::sign(slope_fraction) > 0 ? TrendDirection::Uptrend : TrendDirection::Downtrend;
}

TrendDirection classify(const Series &values, size_t period){
    TrendParams params;
    params.period = period;
    return classify(values, params);
}

}
