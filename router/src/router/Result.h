/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _WAYFINDER_ROUTER_RESULT_H_
#define _WAYFINDER_ROUTER_RESULT_H_

#include "Route.h"
#include "TrafficModel.h"

#include <boost/optional.hpp>

#include <picojson/picojson.h>

namespace wayfinder { namespace router {
    class Result final {
    public:
        enum class Status {
            NO_PATH_FOUND = 0,
            SUCCESS = 1
        };

        Result() = default;
        explicit Result(Route route, boost::optional<TrafficEstimate> trafficEstimate, boost::optional<double> fuelConsumption) : _status(Status::SUCCESS), _route(std::move(route)), _trafficEstimate(std::move(trafficEstimate)), _fuelConsumption(fuelConsumption) { }

        Status getStatus() const { return _status; }
        const Route& getRoute() const { return _route; }
        const boost::optional<TrafficEstimate>& getTrafficEstimate() const { return _trafficEstimate; }
        const boost::optional<double>& getFuelConsumption() const { return _fuelConsumption; } // in liters

        picojson::value serialize() const;

    private:
        Status _status = Status::NO_PATH_FOUND;
        Route _route;
        boost::optional<TrafficEstimate> _trafficEstimate;
        boost::optional<double> _fuelConsumption;
    };
} }

#endif
