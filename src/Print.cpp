#include <algorithm>
#include <iomanip>
#include <ostream>

#include <boost/io/ios_state.hpp>

#include <chartgeom/Print.hpp>

namespace chartgeom{

std::ostream & operator<< (std::ostream &out, TrendDirection direction){
    out << to_string(direction);
    return out;
}

std::ostream & operator<< (std::ostream &out, const TrendLine &line){
    boost::io::ios_all_saver saver(out);
    out << "[" << line.start_index << "," << line.end_index << "] "
        << std::setprecision(6)
        << "slope " << line.slope << " intercept " << line.intercept
        << " r2 " << line.r_squared << " angle " << line.angle_degrees();
    return out;
}

std::ostream & operator<< (std::ostream &out, const PeakTrough &pt){
    boost::io::ios_all_saver saver(out);
    out << to_string(pt.kind) << " " << pt.index << " " << std::fixed << std::setprecision(2)
        << pt.value << " (" << pt.strength << ")";
    return out;
}

std::ostream & operator<< (std::ostream &out, const ChannelLine &line){
    out << "(" << line.start.first << " " << line.start.second << ")->("
        << line.end.first << " " << line.end.second << ") slope " << line.slope;
    return out;
}

std::ostream & operator<< (std::ostream &out, const Channel &channel){
    out << "upper " << channel.upper_line << std::endl;
    out << "lower " << channel.lower_line << std::endl;
    out << "touches " << channel.touches << " width " << channel.width;
    return out;
}

std::ostream & operator<< (std::ostream &out, const std::vector<double> &levels){
    boost::io::ios_all_saver saver(out);
    out << std::fixed << std::setprecision(2);
    for(auto l: levels){
        out << l << " ";
    }
    return out;
}

std::ostream & operator<< (std::ostream &out, const GeometryReport &report){
    out << "Trend: " << report.direction << std::endl;
    if(report.close_trend)
        out << "Trend line: " << *report.close_trend << std::endl;
    else
        out << "Trend line: " << to_string(report.close_trend_error) << std::endl;
    out << "Extrema:" << std::endl;
    for(const auto &pt: report.extrema){
        out << "  " << pt << std::endl;
    }
    out << "Support: " << report.levels.support << std::endl;
    out << "Resistance: " << report.levels.resistance << std::endl;
    out << "Channels: " << report.channels.size() << std::endl;
    for(const auto &c: report.channels){
        out << c << std::endl;
    }
    return out;
}

void print_report(std::ostream &out, const PriceFrame &frame, const GeometryReport &report,
        size_t max_channels){
    out << frame.ticker << " " << frame.size() << " bars" << std::endl;
    out << "Trend: " << report.direction << std::endl;
    if(report.close_trend)
        out << "Trend line: " << *report.close_trend << std::endl;
    else
        out << "Trend line: " << to_string(report.close_trend_error) << std::endl;

    out << "Extrema:" << std::endl;
    for(const auto &pt: report.extrema){
        out << "  " << frame.data[pt.index].time << " " << pt << std::endl;
    }
    out << "Support: " << report.levels.support << std::endl;
    out << "Resistance: " << report.levels.resistance << std::endl;

    out << "Channels: " << report.channels.size() << std::endl;
    size_t shown = std::min(max_channels, report.channels.size());
    for(size_t i = 0; i < shown; i++){
        out << report.channels[i] << std::endl;
    }
}

}
