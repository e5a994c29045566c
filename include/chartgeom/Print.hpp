#pragma once

#include <ostream>
#include <vector>

#include <chartgeom/Analysis.hpp>

namespace chartgeom{

std::ostream & operator<< (std::ostream &out, TrendDirection direction);
std::ostream & operator<< (std::ostream &out, const TrendLine &line);
std::ostream & operator<< (std::ostream &out, const PeakTrough &pt);
std::ostream & operator<< (std::ostream &out, const ChannelLine &line);
std::ostream & operator<< (std::ostream &out, const Channel &channel);
std::ostream & operator<< (std::ostream &out, const std::vector<double> &levels);
std::ostream & operator<< (std::ostream &out, const GeometryReport &report);

/* report with extrema labeled by bar time, at most @max_channels channels */
void print_report(std::ostream &out, const PriceFrame &frame, const GeometryReport &report,
        size_t max_channels = 5);

}
