#include <algorithm>
#include <cmath>
#include <numbers>

#include <chartgeom/LinearRegression.hpp>

namespace chartgeom{

double TrendLine::angle_degrees() const{
    return std::atan(slope) * 180.0 / std::numbers::pi;
}

const char *to_string(FitError e){
    switch(e){
        case FitError::None:
            return "none";
        case FitError::InvalidRange:
            return "invalid range";
        case FitError::InsufficientPoints:
            return "insufficient points";
    }
    return "unknown";
}

FitResult fit(const Series &values, ssize_t start, ssize_t end){
    if(start < 0 || start >= end || end >= (ssize_t)values.size())
        return FitResult{FitError::InvalidRange};

    double sumx = 0;
    double sumx2 = 0;
    double sumy = 0;
    double sumxy = 0;
    size_t count = 0;

    for(ssize_t i = start; i <= end; i++){
        if(!values[i])
            continue;
        double x = i;
        double y = *values[i];
        sumx += x;
        sumx2 += x*x;
        sumy += y;
        sumxy += x*y;
        count++;
    }
    if(count < 2)
        return FitResult{FitError::InsufficientPoints};

    double n = count;
    double slope = 0;
    double intercept = sumy / n;
    double denominator = n * sumx2 - sumx * sumx;
    if(denominator != 0){
        slope = (n * sumxy - sumx * sumy) / denominator;
        intercept = (sumy - slope * sumx) / n;
    }

    double ymean = sumy / n;
    double ss_tot = 0;
    double ss_res = 0;
    for(ssize_t i = start; i <= end; i++){
        if(!values[i])
            continue;
        double y = *values[i];
        double predicted = slope * i + intercept;
        ss_tot += (y - ymean) * (y - ymean);
        ss_res += (y - predicted) * (y - predicted);
    }
    double r_squared = 1.0;
    if(ss_tot != 0)
        r_squared = std::max(0.0, 1.0 - ss_res / ss_tot);

    LOG_DEBUG("fit [%zd, %zd] n=%zu slope=%f r2=%f", start, end, count, slope, r_squared);

    return FitResult{TrendLine{slope, intercept, (size_t)start, (size_t)end, r_squared}};
}

FitResult fit(const Series &values){
    return fit(values, 0, (ssize_t)values.size() - 1);
}

}
