#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

#include <boost/date_time/posix_time/posix_time.hpp>

namespace chartgeom{

namespace bt = boost::posix_time;

/* nullopt marks a missing sample inside an otherwise valid series */
using Sample = std::optional<double>;
using Series = std::vector<Sample>;

constexpr size_t SERIES_END = std::numeric_limits<size_t>::max();

/* non-null samples of [start, end], end clamped to the series */
std::vector<double> valid_values(const Series &values, size_t start = 0, size_t end = SERIES_END);
size_t count_valid(const Series &values, size_t start = 0, size_t end = SERIES_END);

struct Bar{
    bt::ptime time;
    Sample open;
    Sample high;
    Sample low;
    Sample close;
    uint64_t volume;

    Bar(): time(), volume(0){}
    Bar(bt::ptime time, Sample open, Sample high, Sample low, Sample close, uint64_t volume):
        time(time), open(open), high(high), low(low), close(close), volume(volume){}
};

/* OHLCV history of one symbol, index i of every series is data[i] */
class PriceFrame{
public:
    std::string ticker;
    std::vector<Bar> data;

    PriceFrame(){}
    PriceFrame(const std::string &ticker): ticker(ticker){}

    void push(const Bar &bar){
        data.push_back(bar);
    }
    size_t size() const { return data.size(); }
    bool empty() const { return data.empty(); }

    Series opens() const;
    Series highs() const;
    Series lows() const;
    Series closes() const;

    /* bars [start, end), end clamped to size() */
    PriceFrame slice(size_t start, size_t end = SERIES_END) const;

    /* indices of bars where both high and low are set and high < low */
    std::vector<size_t> validate() const;
};

}
