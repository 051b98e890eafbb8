#include "Route.h"

#include <cmath>
#include <cstdint>

namespace {
    double roundDecimals(double value, int decimals) {
        double scale = std::pow(10.0, decimals);
        return std::round(value * scale) / scale;
    }
}

namespace wayfinder { namespace router {
    double Route::getDisplayDistance() const {
        return roundDecimals(_distance, 2);
    }

    long Route::getDisplayTime() const {
        return std::lround(_time);
    }

    boost::optional<double> Route::getFuelConsumption(double litersPerKm) const {
        if (_mode != TravelMode::CAR) {
            return boost::optional<double>();
        }
        return roundDecimals(getDisplayDistance() * litersPerKm, 2);
    }

    picojson::value Route::serialize() const {
        picojson::array geometryDef;
        for (const WGSPos& pos : _geometry) {
            picojson::array posDef;
            posDef.emplace_back(pos(0));
            posDef.emplace_back(pos(1));
            geometryDef.emplace_back(std::move(posDef));
        }
        picojson::array nodeIdsDef;
        for (Graph::NodeId nodeId : _nodeIds) {
            nodeIdsDef.emplace_back(static_cast<std::int64_t>(nodeId));
        }
        picojson::object routeObj;
        routeObj["mode"] = picojson::value(getTravelModeName(_mode));
        routeObj["geometry"] = picojson::value(geometryDef);
        routeObj["nodes"] = picojson::value(nodeIdsDef);
        routeObj["distance"] = picojson::value(getDisplayDistance());
        routeObj["time"] = picojson::value(static_cast<std::int64_t>(getDisplayTime()));
        return picojson::value(routeObj);
    }
} }
