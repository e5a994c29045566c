#include <fstream>
#include <stdexcept>

#include <boost/program_options/parsers.hpp>

#include "Options.hpp"

po::options_description tuning_options(ScanOptions &options){
    auto &c = options.config;

    po::options_description desc("Geometry tuning");
    desc.add_options()
        ("min-distance", po::value<size_t>(&c.extrema.min_distance)->default_value(c.extrema.min_distance),
            "minimum bars between extrema of the same kind")
        ("prominence", po::value<double>(&c.extrema.prominence_threshold)->default_value(c.extrema.prominence_threshold),
            "minimum prominence as a fraction of the value range")
        ("level-min-distance", po::value<size_t>(&c.levels.min_distance)->default_value(c.levels.min_distance),
            "extrema spacing used for support/resistance")
        ("level-tolerance", po::value<double>(&c.levels.tolerance)->default_value(c.levels.tolerance),
            "relative tolerance when clustering levels")
        ("lookback", po::value<size_t>(&c.levels.lookback_period)->default_value(c.levels.lookback_period),
            "support/resistance lookback period")
        ("trend-period", po::value<size_t>(&c.trend.period)->default_value(c.trend.period),
            "trailing bars used for the trend direction")
        ("min-r-squared", po::value<double>(&c.trend.min_r_squared)->default_value(c.trend.min_r_squared),
            "weaker trend fits are sideways")
        ("slope-threshold", po::value<double>(&c.trend.slope_threshold)->default_value(c.trend.slope_threshold),
            "relative move over the period needed for a trend")
        ("min-touches", po::value<uint32_t>(&c.channels.min_touches)->default_value(c.channels.min_touches),
            "minimum touches of a channel")
        ("slope-tolerance", po::value<double>(&c.channels.slope_tolerance)->default_value(c.channels.slope_tolerance),
            "relative slope difference of parallel channel lines")
        ("touch-tolerance", po::value<double>(&c.channels.touch_tolerance)->default_value(c.channels.touch_tolerance),
            "relative distance of a touch to the channel line")
        ("channel-min-distance", po::value<size_t>(&c.channels.extrema.min_distance)->default_value(c.channels.extrema.min_distance),
            "extrema spacing used for channels")
    ;
    return desc;
}

po::options_description scan_options(ScanOptions &options){
    po::options_description desc("Allowed options");
    desc.add_options()
        ("help", "produce help message")
        ("config", po::value<std::string>(&options.config_file), "ini file with tuning options")
        ("input-file", po::value< std::vector<std::string> >(&options.input_files)->multitoken(), "input bar file")
        ("max-channels", po::value<size_t>(&options.max_channels)->default_value(options.max_channels),
            "channels printed per file")
    ;
    desc.add(tuning_options(options));
    return desc;
}

po::variables_map parse_options(int argc, const char * const argv[],
        const po::options_description &desc, ScanOptions &options){
    po::positional_options_description positional;
    positional.add("input-file", -1);

    po::variables_map vm;
    po::store(po::command_line_parser(argc, argv).options(desc).positional(positional)
        .style(po::command_line_style::unix_style ^ po::command_line_style::allow_short).run(), vm);

    if(vm.count("config")){
        auto file = vm["config"].as<std::string>();
        std::ifstream ifs(file);
        if(!ifs)
            throw std::invalid_argument("cannot open config " + file);
        po::store(po::parse_config_file(ifs, desc), vm);
    }
    po::notify(vm);

    /* every extrema search shares --prominence */
    options.config.levels.prominence_threshold = options.config.extrema.prominence_threshold;
    options.config.channels.extrema.prominence_threshold = options.config.extrema.prominence_threshold;
    return vm;
}
