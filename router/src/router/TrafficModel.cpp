#include "TrafficModel.h"

#include <cmath>
#include <cstdint>
#include <stdexcept>

namespace wayfinder { namespace router {
    picojson::value TrafficEstimate::serialize() const {
        picojson::object estimateObj;
        estimateObj["level"] = picojson::value(TrafficModel::getTrafficLevelName(_level));
        estimateObj["multiplier"] = picojson::value(_multiplier);
        estimateObj["time"] = picojson::value(static_cast<std::int64_t>(_adjustedTime));
        return picojson::value(estimateObj);
    }

    TrafficLevel TrafficModel::getTrafficLevel(int hour) {
        switch (hour) {
        case 7: case 8: case 9:
        case 16: case 17: case 18:
            return TrafficLevel::HEAVY;
        case 10: case 11:
        case 14: case 15:
        case 19: case 20:
            return TrafficLevel::MODERATE;
        default:
            if (hour < 0 || hour > 23) {
                throw std::out_of_range("Hour of day must be in range 0..23");
            }
            return TrafficLevel::LIGHT;
        }
    }

    double TrafficModel::getMultiplier(TrafficLevel level) {
        switch (level) {
        case TrafficLevel::HEAVY:
            return 1.5;
        case TrafficLevel::MODERATE:
            return 1.2;
        case TrafficLevel::LIGHT:
            return 1.0;
        }
        throw std::invalid_argument("Illegal traffic level");
    }

    std::string TrafficModel::getTrafficLevelName(TrafficLevel level) {
        switch (level) {
        case TrafficLevel::HEAVY:
            return "heavy";
        case TrafficLevel::MODERATE:
            return "moderate";
        case TrafficLevel::LIGHT:
            return "light";
        }
        throw std::invalid_argument("Illegal traffic level");
    }

    TrafficEstimate TrafficModel::adjust(double baseTime, int hour) {
        if (!std::isfinite(baseTime) || baseTime < 0) {
            throw std::invalid_argument("Base time must be finite and non-negative");
        }
        TrafficLevel level = getTrafficLevel(hour);
        double multiplier = getMultiplier(level);
        return TrafficEstimate(level, multiplier, std::lround(baseTime * multiplier));
    }
} }
