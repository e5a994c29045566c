#include <algorithm>
#include <cmath>
#include <optional>

#include <chartgeom/Utils.hpp>
#include <chartgeom/Channels.hpp>

namespace chartgeom{

static double pair_slope(const PeakTrough &a, const PeakTrough &b){
    return (b.value - a.value) / ((double)b.index - (double)a.index);
}

/* relative to the signed line value, anything below a negative line counts */
static bool touches_line(double value, double expected, double tolerance){
    if(expected == 0)
        return false;
    return std::abs(value - expected) / expected <= tolerance;
}

uint32_t count_touches(const Series &highs, const Series &lows,
        const PeakTrough &p1, const PeakTrough &p2,
        const PeakTrough &t1, const PeakTrough &t2, double tolerance){
    uint32_t touches = DEFINING_TOUCHES;

    double upper_slope = pair_slope(p1, p2);
    double upper_intercept = p1.value - upper_slope * p1.index;
    double lower_slope = pair_slope(t1, t2);
    double lower_intercept = t1.value - lower_slope * t1.index;

    size_t first = std::min({p1.index, p2.index, t1.index, t2.index});
    size_t last = std::max({p1.index, p2.index, t1.index, t2.index});

    for(size_t i = first; i <= last; i++){
        if(i >= highs.size() || i >= lows.size())
            break;
        if(!highs[i] || !lows[i])
            continue;

        if(touches_line(*highs[i], upper_slope * i + upper_intercept, tolerance))
            touches++;
        if(touches_line(*lows[i], lower_slope * i + lower_intercept, tolerance))
            touches++;
    }
    return touches;
}

static ChannelLine make_line(const PeakTrough &a, const PeakTrough &b){
    return ChannelLine{{a.index, a.value}, {b.index, b.value}, pair_slope(a, b)};
}

std::vector<Channel> detect(const Series &highs, const Series &lows, const ChannelParams &params){
    std::vector<Channel> channels;

    auto peaks = select(find_extrema(highs, params.extrema), ExtremumKind::Peak);
    auto troughs = select(find_extrema(lows, params.extrema), ExtremumKind::Trough);
    if(peaks.size() < 2 || troughs.size() < 2)
        return channels;

    for(size_t i = 0; i + 1 < peaks.size(); i++){
        for(size_t j = i + 1; j < peaks.size(); j++){
            const auto &p1 = peaks[i];
            const auto &p2 = peaks[j];
            if(p1.index == p2.index)
                continue;
            double upper_slope = pair_slope(p1, p2);

            std::optional<std::pair<size_t, size_t>> best;
            uint32_t max_touches = 0;

            for(size_t k = 0; k + 1 < troughs.size(); k++){
                for(size_t l = k + 1; l < troughs.size(); l++){
                    const auto &t1 = troughs[k];
                    const auto &t2 = troughs[l];
                    if(t1.index == t2.index)
                        continue;

                    double lower_slope = pair_slope(t1, t2);
                    double divergence = std::abs(upper_slope - lower_slope)
                                            / (std::abs(upper_slope) + SLOPE_EPSILON);
                    if(divergence >= params.slope_tolerance)
                        continue;

                    auto touches = count_touches(highs, lows, p1, p2, t1, t2, params.touch_tolerance);
                    if(touches > max_touches){
                        max_touches = touches;
                        best = std::make_pair(k, l);
                    }
                }
            }

            if(!best || max_touches < params.min_touches)
                continue;

            const auto &t1 = troughs[best->first];
            const auto &t2 = troughs[best->second];
            LOG_DEBUG("channel peaks [%zu, %zu] troughs [%zu, %zu] touches %u",
                p1.index, p2.index, t1.index, t2.index, max_touches);
            channels.push_back(Channel{make_line(p1, p2), make_line(t1, t2),
                max_touches, std::abs(p1.value - t1.value)});
        }
    }

    std::stable_sort(channels.begin(), channels.end(), [](const Channel &a, const Channel &b){
        return a.touches > b.touches;
    });
    return channels;
}

std::vector<Channel> detect(const Series &highs, const Series &lows, uint32_t min_touches){
    ChannelParams params;
    params.min_touches = min_touches;
    return detect(highs, lows, params);
}

std::vector<Channel> detect(const PriceFrame &frame, const ChannelParams &params){
    return detect(frame.highs(), frame.lows(), params);
}

}
