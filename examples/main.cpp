#include "zonekit/zonekit.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

    std::vector<std::string> split_list(const std::string &s) {
        std::vector<std::string> out;
        std::stringstream ss(s);
        std::string item;
        while (std::getline(ss, item, ',')) {
            if (!item.empty())
                out.push_back(item);
        }
        return out;
    }

    void usage(const char *prog) {
        std::cerr << "Usage: " << prog << " <zones.geojson> <classes.geojson> <output.geojson>\n"
                  << "         --zone-fields a,b [--class-fields c] [--sum-fields POP,HH] [--emit-sums]\n"
                  << "         [--crs wgs|enu]\n";
    }

} // namespace

int main(int argc, char *argv[]) {
    std::vector<std::string> positional;
    zonekit::SummarizeConfig config;
    zonekit::CRS outputCrs = zonekit::CRS::WGS;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = (i + 1) < argc;
        if (arg == "--zone-fields" && has_value) {
            config.zone_fields = split_list(argv[++i]);
        } else if (arg == "--class-fields" && has_value) {
            config.class_fields = split_list(argv[++i]);
        } else if (arg == "--sum-fields" && has_value) {
            config.sum_fields = split_list(argv[++i]);
        } else if (arg == "--emit-sums") {
            config.emit_sums = true;
        } else if (arg == "--crs" && has_value) {
            std::string crs = argv[++i];
            if (crs == "wgs") {
                outputCrs = zonekit::CRS::WGS;
            } else if (crs == "enu") {
                outputCrs = zonekit::CRS::ENU;
            } else {
                std::cerr << "ERROR: unknown --crs value: " << crs << "\n";
                return 2;
            }
        } else if (arg == "-h" || arg == "--help") {
            usage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "ERROR: unknown or incomplete option: " << arg << "\n";
            usage(argv[0]);
            return 2;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 3 || config.zone_fields.empty()) {
        usage(argv[0]);
        return 2;
    }

    try {
        auto zones = zonekit::read(positional[0]);
        auto classes = zonekit::read(positional[1]);
        std::cout << "ZONES\n" << zones << "CLASSES\n" << classes;

        config.zones = &zones;
        config.classes = &classes;

        zonekit::StreamFeedback feedback;
        auto report = zonekit::summarize(config, positional[2], feedback, outputCrs);

        std::cout << "Pairs: " << report.pairs << ", records: " << report.records
                  << ", invalid class features: " << report.invalid_class_features
                  << ", feature errors: " << report.feature_errors << "\n";
    } catch (std::exception &e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
