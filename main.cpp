#include <cstdlib>
#include <iostream>
#include <vector>

#include <chartgeom/Print.hpp>

#include "Options.hpp"
#include "PriceLoader.hpp"

using namespace chartgeom;

static int scan(const ScanOptions &options){
    int failed = 0;
    for(const auto &file: options.input_files){
        try{
            auto frame = load_frame(file);
            if(frame.empty()){
                LOG_WARNING("%s: no bars", file.c_str());
                failed++;
                continue;
            }
            auto report = analyze(frame, options.config);
            print_report(std::cout, frame, report, options.max_channels);
            std::cout << std::endl;
        }catch(const std::exception& e) {
            LOG_ERROR("%s: %s", file.c_str(), e.what());
            failed++;
        }
    }
    LOG_INFO("scanned %zu files, %d failed", options.input_files.size(), failed);
    return failed == 0 ? 0 : 1;
}

int main(int argc, char * argv[]){
    ScanOptions options;
    auto desc = scan_options(options);

    po::variables_map vm;
    try{
        vm = parse_options(argc, argv, desc, options);
    }catch(const std::exception& e) {
        LOG_ERROR("%s", e.what());
        std::cout << desc;
        return -1;
    }

    if (vm.count("help")) {
        std::cout << desc;
        return 0;
    }
    if (vm.count("input-file")) {
        std::cout << "Input files are: ";
        for(const auto &f: options.input_files){
            std::cout << f << " ";
        }
        std::cout << std::endl;

        return scan(options);
    }

    std::cout << desc;
    return -1;
}
