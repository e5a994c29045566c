#pragma once

#include <string>
#include <vector>

#include <boost/program_options/options_description.hpp>
#include <boost/program_options/variables_map.hpp>

#include <chartgeom/Analysis.hpp>

namespace po = boost::program_options;

struct ScanOptions{
    chartgeom::GeometryConfig config;
    std::vector<std::string> input_files;
    std::string config_file;
    size_t max_channels{5};
};

/* tunables bound directly into @options, defaults taken from it */
po::options_description tuning_options(ScanOptions &options);
po::options_description scan_options(ScanOptions &options);

/* command line first, then --config file for anything still defaulted */
po::variables_map parse_options(int argc, const char * const argv[],
        const po::options_description &desc, ScanOptions &options);
