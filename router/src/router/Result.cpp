#include "Result.h"

#include <cstdint>

namespace wayfinder { namespace router {
    picojson::value Result::serialize() const {
        picojson::object resultObj;
        resultObj["status"] = picojson::value(static_cast<std::int64_t>(_status));
        if (_status == Status::SUCCESS) {
            picojson::value routeDef = _route.serialize();
            if (_fuelConsumption) {
                routeDef.get<picojson::object>()["fuel"] = picojson::value(*_fuelConsumption);
            }
            resultObj["route"] = routeDef;
            if (_trafficEstimate) {
                resultObj["traffic"] = _trafficEstimate->serialize();
            }
        } else {
            resultObj["error"] = picojson::value(std::string("No path found between these points"));
        }
        return picojson::value(resultObj);
    }
} }
