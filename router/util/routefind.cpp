#include "router/GraphBuilder.h"
#include "router/RouteFinder.h"
#include "router/Logger.h"

#include <memory>
#include <stdexcept>
#include <string>
#include <iostream>
#include <fstream>

#include <boost/optional.hpp>

#include <picojson/picojson.h>

std::shared_ptr<const wayfinder::router::Graph> loadGraph(const std::string& graphFile) {
    std::ifstream ifs;
    ifs.exceptions(std::ifstream::failbit | std::ifstream::badbit);
    ifs.open(graphFile);
    picojson::value graphDef;
    if (auto err = picojson::parse(graphDef, ifs); !err.empty()) {
        throw std::runtime_error("Graph parsing failed: " + err);
    }
    ifs.close();

    // GeoJSON documents always have a type, node-link documents do not
    wayfinder::router::GraphBuilder builder;
    if (graphDef.contains("type")) {
        builder.importGeoJSON(graphDef);
    } else {
        builder.importNodeLink(graphDef);
    }
    return builder.build();
}

int main(int argc, char* argv[]) {
    if (argc < 6) {
        std::cerr << "Usage: routefind graph-file startlat startlon goallat goallon [car|walk|bike] [hour]" << std::endl;
        return -1;
    }

    try {
        using namespace wayfinder::router;

        std::string graphFile = argv[1];
        WGSPos startPos(std::stod(argv[3]), std::stod(argv[2]));
        WGSPos goalPos(std::stod(argv[5]), std::stod(argv[4]));
        TravelMode mode = argc > 6 ? parseTravelMode(argv[6]) : TravelMode::WALK;
        boost::optional<int> hour;
        if (argc > 7) {
            hour = std::stoi(argv[7]);
        }

        auto logger = std::make_shared<StreamLogger>(std::cerr);
        RouteFinder routeFinder(loadGraph(graphFile), RouteFinder::RouteOptions(), logger);
        Result result = routeFinder.find(Query(startPos, goalPos, mode, hour));
        std::cout << result.serialize().serialize(true) << std::endl;
    } catch (const std::exception& ex) {
        std::cerr << "Exception while finding route: " << ex.what() << std::endl;
        return -1;
    }
    return 0;
}
