#include <algorithm>
#include <cmath>

#include <chartgeom/Utils.hpp>
#include <chartgeom/Levels.hpp>
#include <chartgeom/Extremums.hpp>

namespace chartgeom{

/* relative to the signed mean, so a negative mean absorbs every value. A zero mean only absorbs zeros */
static bool within_tolerance(double value, double mean, double tolerance){
    double distance = std::abs(value - mean);
    if(mean == 0)
        return distance == 0;
    return distance / mean <= tolerance;
}

std::vector<double> cluster(std::vector<double> levels, double tolerance){
    std::vector<double> clustered;
    if(levels.empty())
        return clustered;

    std::sort(levels.begin(), levels.end());

    double sum = levels[0];
    size_t count = 1;
    for(size_t i = 1; i < levels.size(); i++){
        double mean = sum / count;
        if(within_tolerance(levels[i], mean, tolerance)){
            sum += levels[i];
            count++;
        } else {
            clustered.push_back(mean);
            sum = levels[i];
            count = 1;
        }
    }
    clustered.push_back(sum / count);

    return clustered;
}

static std::vector<double> extremum_values(const Series &values, ExtremumKind kind,
        const LevelParams &params){
    std::vector<double> levels;
    for(const auto &pt: find_extrema(values, params.min_distance, params.prominence_threshold)){
        if(pt.kind == kind)
            levels.push_back(pt.value);
    }
    return levels;
}

SupportResistance locate(const Series &highs, const Series &lows, const LevelParams &params){
    SupportResistance sr;
    sr.resistance = cluster(extremum_values(highs, ExtremumKind::Peak, params), params.tolerance);
    sr.support = cluster(extremum_values(lows, ExtremumKind::Trough, params), params.tolerance);
    LOG_DEBUG("located %zu support, %zu resistance levels", sr.support.size(), sr.resistance.size());
    return sr;
}

SupportResistance locate(const Series &highs, const Series &lows, size_t lookback_period){
    LevelParams params;
    params.lookback_period = lookback_period;
    return locate(highs, lows, params);
}

SupportResistance locate(const PriceFrame &frame, const LevelParams &params){
    return locate(frame.highs(), frame.lows(), params);
}

}
