#include <algorithm>
#include <iterator>
#include <optional>

#include <chartgeom/Utils.hpp>
#include <chartgeom/Extremums.hpp>

namespace chartgeom{

const char *to_string(ExtremumKind kind){
    return kind == ExtremumKind::Peak ? "peak" : "trough";
}

/* lowest (is_min) or highest valid sample of [first, last) */
static std::optional<double> window_bound(const Series &values, size_t first, size_t last, bool is_min){
    std::optional<double> bound;
    for(size_t i = first; i < last; i++){
        if(!values[i])
            continue;
        if(!bound || (is_min ? *values[i] < *bound : *values[i] > *bound))
            bound = values[i];
    }
    return bound;
}

double prominence(const Series &values, size_t index, ExtremumKind kind){
    if(index == 0 || index + 1 >= values.size() || !values[index])
        return 0.0;

    double current = *values[index];
    /* series of 3 samples still compares against its direct neighbours */
    size_t window = std::max<size_t>(1, std::min(PROMINENCE_WINDOW_MAX, values.size() / 4));
    size_t left = index > window ? index - window : 0;
    size_t right = std::min(values.size(), index + window + 1);

    bool is_peak = kind == ExtremumKind::Peak;
    auto left_bound = window_bound(values, left, index, is_peak);
    auto right_bound = window_bound(values, index + 1, right, is_peak);
    if(!left_bound || !right_bound)
        return 0.0;

    double p;
    if(is_peak)
        p = current - std::max(*left_bound, *right_bound);
    else
        p = std::min(*left_bound, *right_bound) - current;
    return std::max(0.0, p);
}

std::vector<PeakTrough> find_extrema(const Series &values, size_t min_distance,
        double prominence_threshold){
    std::vector<PeakTrough> extrema;
    if(values.size() < 3)
        return extrema;

    auto valid = valid_values(values);
    if(valid.empty())
        return extrema;

    auto [lowest, highest] = std::minmax_element(valid.begin(), valid.end());
    double value_range = *highest - *lowest;
    double min_prominence = value_range * prominence_threshold;

    std::optional<size_t> last_peak;
    std::optional<size_t> last_trough;

    for(size_t i = 1; i + 1 < values.size(); i++){
        if(!values[i] || !values[i - 1] || !values[i + 1])
            continue;

        double current = *values[i];
        double left = *values[i - 1];
        double right = *values[i + 1];

        ExtremumKind kind;
        if(current > left && current > right)
            kind = ExtremumKind::Peak;
        else if(current < left && current < right)
            kind = ExtremumKind::Trough;
        else
            continue;

        double p = prominence(values, i, kind);
        if(p < min_prominence){
            LOG_DEBUG("%s at %zu rejected: prominence %f < %f", to_string(kind), i, p, min_prominence);
            continue;
        }

        auto &last = kind == ExtremumKind::Peak ? last_peak : last_trough;
        if(last && i - *last < min_distance){
            LOG_DEBUG("%s at %zu rejected: %zu after previous", to_string(kind), i, i - *last);
            continue;
        }
        last = i;

        double strength = 1.0;
        if(value_range > 0)
            strength = std::min(1.0, p / (value_range * STRENGTH_RANGE_FRACTION));
        extrema.push_back(PeakTrough{i, current, kind, strength});
    }

    return extrema;
}

std::vector<PeakTrough> find_extrema(const Series &values, const ExtremaParams &params){
    return find_extrema(values, params.min_distance, params.prominence_threshold);
}

std::vector<PeakTrough> select(const std::vector<PeakTrough> &extrema, ExtremumKind kind){
    std::vector<PeakTrough> selected;
    std::copy_if(extrema.begin(), extrema.end(), std::back_inserter(selected),
        [kind](const PeakTrough &pt){ return pt.kind == kind; });
    return selected;
}

}
