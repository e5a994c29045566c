#pragma once

#include <sys/types.h>

#include <chartgeom/Utils.hpp>
#include <chartgeom/Series.hpp>

namespace chartgeom{

/* value(i) = slope * i + intercept over [start_index, end_index] */
struct TrendLine{
    double slope;
    double intercept;
    size_t start_index;
    size_t end_index;
    double r_squared; //floored at 0

    double value_at(size_t index) const{
        return slope * index + intercept;
    }
    double angle_degrees() const;
};

enum class FitError{
    None,
    InvalidRange,
    InsufficientPoints,
};

const char *to_string(FitError e);

class FitResult{
    FitError err;
    TrendLine line;
public:
    FitResult(const TrendLine &line): err(FitError::None), line(line) {}
    FitResult(FitError err): err(err), line{} {
        ASSERT_ON(err == FitError::None);
    }
    bool ok() const{
        return err == FitError::None;
    }
    FitError error() const{
        return err;
    }
    const TrendLine &value() const{
        ASSERT_ON(!ok());
        return line;
    }
};

/*
    Least squares over (i, values[i]) for i in [start, end], null samples skipped.
    InvalidRange unless 0 <= start < end < values.size()
    InsufficientPoints when less than 2 samples are set
*/
FitResult fit(const Series &values, ssize_t start, ssize_t end);
FitResult fit(const Series &values);

}
