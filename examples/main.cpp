#include "geoscene/geoscene.hpp"

#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {
    dp::Geo parseDatum(const std::string &text) {
        // lon,lat,alt as in GeoJSON positions
        std::istringstream iss(text);
        double lon = 0.0, lat = 0.0, alt = 0.0;
        char sep1 = 0, sep2 = 0;
        if (!(iss >> lon >> sep1 >> lat >> sep2 >> alt) || sep1 != ',' || sep2 != ',')
            throw std::invalid_argument("--enu expects lon,lat,alt, got \"" + text + "\"");
        return dp::Geo{lat, lon, alt};
    }
} // namespace

int main(int argc, char **argv) {
    spdlog::cfg::load_env_levels();

    std::string file;
    std::string datum;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--enu" && i + 1 < argc) {
            datum = argv[++i];
        } else {
            file = arg;
        }
    }
    if (file.empty()) {
        std::cerr << "usage: " << argv[0] << " [--enu lon,lat,alt] <file.geojson>\n";
        return 2;
    }

    try {
        if (!datum.empty())
            geoscene::CrsRegistry::global().registerCrsName("ENU", geoscene::localTangentPlane(parseDatum(datum)));

        auto entities = std::make_shared<geoscene::EntityCollection>();
        geoscene::GeoJsonDataSource dataSource(entities);

        bool failed = false;
        dataSource.errorEvent().connect([&failed](const geoscene::GeoJsonDataSource &, std::exception_ptr error) {
            failed = true;
            try {
                std::rethrow_exception(error);
            } catch (const std::exception &e) {
                std::cerr << "ERROR: " << e.what() << "\n";
            }
        });

        dataSource.loadUrl(file).get();
        if (failed)
            return 1;

        std::cout << *entities;
    } catch (std::exception &e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
