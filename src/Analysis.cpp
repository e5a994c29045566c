#include <chartgeom/Utils.hpp>
#include <chartgeom/Analysis.hpp>

namespace chartgeom{

GeometryReport analyze(const PriceFrame &frame, const GeometryConfig &config){
    GeometryReport report;

    auto closes = frame.closes();
    auto highs = frame.highs();
    auto lows = frame.lows();

    report.direction = classify(closes, config.trend);

    auto result = fit(closes);
    if(result.ok())
        report.close_trend = result.value();
    else
        report.close_trend_error = result.error();

    report.extrema = find_extrema(closes, config.extrema);
    report.levels = locate(highs, lows, config.levels);
    report.channels = detect(highs, lows, config.channels);

    LOG_DEBUG("%s: %zu bars, %zu extrema, %zu channels", frame.ticker.c_str(),
        frame.size(), report.extrema.size(), report.channels.size());
    return report;
}

}
