#include "Query.h"

#include <cstdint>
#include <stdexcept>

namespace wayfinder { namespace router {
    picojson::value Query::serialize() const {
        picojson::array pos0Def, pos1Def;
        for (std::size_t i = 0; i < 2; i++) {
            pos0Def.emplace_back(_points[0](i));
            pos1Def.emplace_back(_points[1](i));
        }
        picojson::object queryObj;
        queryObj["pos0"] = picojson::value(pos0Def);
        queryObj["pos1"] = picojson::value(pos1Def);
        queryObj["mode"] = picojson::value(getTravelModeName(_mode));
        if (_hour) {
            queryObj["hour"] = picojson::value(static_cast<std::int64_t>(*_hour));
        }
        return picojson::value(queryObj);
    }

    Query Query::parse(const picojson::value& queryDef) {
        const picojson::array& pos0Def = queryDef.get("pos0").get<picojson::array>();
        const picojson::array& pos1Def = queryDef.get("pos1").get<picojson::array>();
        WGSPos pos0, pos1;
        for (std::size_t i = 0; i < 2; i++) {
            pos0(i) = pos0Def.at(i).get<double>();
            pos1(i) = pos1Def.at(i).get<double>();
        }
        TravelMode mode = TravelMode::WALK;
        if (queryDef.contains("mode")) {
            mode = parseTravelMode(queryDef.get("mode").get<std::string>());
        }
        boost::optional<int> hour;
        if (queryDef.contains("hour")) {
            std::int64_t hourValue = queryDef.get("hour").get<std::int64_t>();
            if (hourValue < 0 || hourValue > 23) {
                throw std::out_of_range("Hour of day must be in range 0..23");
            }
            hour = static_cast<int>(hourValue);
        }
        return Query(pos0, pos1, mode, hour);
    }
} }
