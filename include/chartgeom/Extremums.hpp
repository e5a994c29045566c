#pragma once

#include <vector>

#include <chartgeom/Series.hpp>

namespace chartgeom{

enum class ExtremumKind{
    Peak,
    Trough,
};

struct PeakTrough{
    size_t index;
    double value;
    ExtremumKind kind;
    double strength; //[0, 1]

    bool operator==(const PeakTrough &other) const = default;
};

struct ExtremaParams{
    size_t min_distance{5};
    double prominence_threshold{0.01}; //fraction of the series value range
};

/* prominence lookup reaches at most this many samples to each side */
constexpr size_t PROMINENCE_WINDOW_MAX = 20;
/* strength == 1 once prominence reaches this fraction of the value range */
constexpr double STRENGTH_RANGE_FRACTION = 0.1;

/*
    Strict local maxima/minima of @values whose prominence is at least
    value_range * prominence_threshold. Same-kind entries are at least
    @min_distance apart, peaks and troughs are spaced independently.
    Result is ordered by index.
*/
std::vector<PeakTrough> find_extrema(const Series &values, size_t min_distance = 5,
        double prominence_threshold = 0.01);
std::vector<PeakTrough> find_extrema(const Series &values, const ExtremaParams &params);

/* drop from the nearest opposing levels within the adaptive window, >= 0 */
double prominence(const Series &values, size_t index, ExtremumKind kind);

std::vector<PeakTrough> select(const std::vector<PeakTrough> &extrema, ExtremumKind kind);

const char *to_string(ExtremumKind kind);

}
