/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _WAYFINDER_ROUTER_ROUTE_H_
#define _WAYFINDER_ROUTER_ROUTE_H_

#include "Base.h"
#include "Graph.h"
#include "TravelMode.h"

#include <vector>

#include <boost/optional.hpp>

#include <picojson/picojson.h>

namespace wayfinder { namespace router {
    class Route final {
    public:
        Route() = default;
        explicit Route(TravelMode mode, std::vector<Graph::NodeId> nodeIds, std::vector<WGSPos> geometry, double distance, double time) : _mode(mode), _nodeIds(std::move(nodeIds)), _geometry(std::move(geometry)), _distance(distance), _time(time) { }

        TravelMode getMode() const { return _mode; }
        const std::vector<Graph::NodeId>& getNodeIds() const { return _nodeIds; }
        const std::vector<WGSPos>& getGeometry() const { return _geometry; }

        double getDistance() const { return _distance; } // in km
        double getTime() const { return _time; } // in minutes

        double getDisplayDistance() const; // in km, rounded to 2 decimals
        long getDisplayTime() const; // in minutes, rounded to nearest integer

        // Estimated fuel use in liters, only available for car routes
        boost::optional<double> getFuelConsumption(double litersPerKm) const;

        picojson::value serialize() const;

    private:
        TravelMode _mode = TravelMode::WALK;
        std::vector<Graph::NodeId> _nodeIds;
        std::vector<WGSPos> _geometry;
        double _distance = 0.0;
        double _time = 0.0;
    };
} }

#endif
