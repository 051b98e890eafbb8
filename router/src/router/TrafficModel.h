/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _WAYFINDER_ROUTER_TRAFFICMODEL_H_
#define _WAYFINDER_ROUTER_TRAFFICMODEL_H_

#include <string>

#include <picojson/picojson.h>

namespace wayfinder { namespace router {
    enum class TrafficLevel {
        HEAVY    = 0,
        MODERATE = 1,
        LIGHT    = 2
    };

    class TrafficEstimate final {
    public:
        TrafficEstimate() = default;
        explicit TrafficEstimate(TrafficLevel level, double multiplier, long adjustedTime) : _level(level), _multiplier(multiplier), _adjustedTime(adjustedTime) { }

        TrafficLevel getLevel() const { return _level; }
        double getMultiplier() const { return _multiplier; }
        long getAdjustedTime() const { return _adjustedTime; } // in minutes

        picojson::value serialize() const;

    private:
        TrafficLevel _level = TrafficLevel::LIGHT;
        double _multiplier = 1.0;
        long _adjustedTime = 0;
    };

    // Simulated traffic: a fixed hour of day lookup table, without any clock access or other state.
    class TrafficModel final {
    public:
        TrafficModel() = delete;

        static TrafficLevel getTrafficLevel(int hour);

        static double getMultiplier(TrafficLevel level);

        static std::string getTrafficLevelName(TrafficLevel level);

        static TrafficEstimate adjust(double baseTime, int hour);
    };
} }

#endif
