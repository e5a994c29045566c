#include <algorithm>
#include <stdexcept>

#include <chartgeom/Series.hpp>

namespace chartgeom{

std::vector<double> valid_values(const Series &values, size_t start, size_t end){
    std::vector<double> valid;
    if(values.empty())
        return valid;
    end = std::min(end, values.size() - 1);
    for(size_t i = start; i <= end; i++){
        if(values[i])
            valid.push_back(*values[i]);
    }
    return valid;
}

size_t count_valid(const Series &values, size_t start, size_t end){
    if(values.empty())
        return 0;
    end = std::min(end, values.size() - 1);
    size_t count = 0;
    for(size_t i = start; i <= end; i++){
        if(values[i])
            count++;
    }
    return count;
}

template<typename F>
static Series extract(const std::vector<Bar> &data, F &&f){
    Series s;
    s.reserve(data.size());
    for(const auto &bar: data){
        s.push_back(f(bar));
    }
    return s;
}

Series PriceFrame::opens() const{
    return extract(data, [](const Bar &b){ return b.open; });
}
Series PriceFrame::highs() const{
    return extract(data, [](const Bar &b){ return b.high; });
}
Series PriceFrame::lows() const{
    return extract(data, [](const Bar &b){ return b.low; });
}
Series PriceFrame::closes() const{
    return extract(data, [](const Bar &b){ return b.close; });
}

PriceFrame PriceFrame::slice(size_t start, size_t end) const{
    end = std::min(end, data.size());
    if(start > end)
        throw std::invalid_argument("slice start is past its end");

    PriceFrame frame{ticker};
    frame.data.assign(data.begin() + start, data.begin() + end);
    return frame;
}

std::vector<size_t> PriceFrame::validate() const{
    std::vector<size_t> broken;
    for(size_t i = 0; i < data.size(); i++){
        const auto &bar = data[i];
        if(bar.high && bar.low && *bar.high < *bar.low)
            broken.push_back(i);
    }
    return broken;
}

}
