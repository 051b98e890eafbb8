/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _WAYFINDER_ROUTER_ROUTEFINDER_H_
#define _WAYFINDER_ROUTER_ROUTEFINDER_H_

#include "Base.h"
#include "Graph.h"
#include "Query.h"
#include "Result.h"
#include "Logger.h"
#include "PathFinder.h"
#include "SpatialIndex.h"

#include <memory>

#include <picojson/picojson.h>

namespace wayfinder { namespace router {
    class RouteFinder final {
    public:
        struct RouteOptions {
            bool traffic = true;                    // estimate traffic delay when the query contains hour of day
            double fuelConsumption = 0.08;          // fuel consumption for car routes, in liters per km
            std::size_t leafSize = 16;              // spatial index leaf size
        };

        RouteFinder() = delete;
        explicit RouteFinder(std::shared_ptr<const Graph> graph, const RouteOptions& routeOptions = RouteOptions(), std::shared_ptr<Logger> logger = std::shared_ptr<Logger>());

        const std::shared_ptr<const Graph>& getGraph() const { return _graph; }
        const RouteOptions& getRouteOptions() const { return _routeOptions; }

        Result find(const Query& query, const PathFinder::CancelCallback& cancelCallback = PathFinder::CancelCallback()) const;

        static std::unique_ptr<RouteFinder> create(std::shared_ptr<const Graph> graph, const picojson::value& configDef, std::shared_ptr<Logger> logger = std::shared_ptr<Logger>());

    private:
        static SpatialIndex::Options getSpatialIndexOptions(const RouteOptions& routeOptions);

        const std::shared_ptr<const Graph> _graph;
        const RouteOptions _routeOptions;
        const SpatialIndex _spatialIndex;
        const PathFinder _pathFinder;
        const std::shared_ptr<Logger> _logger;
    };
} }

#endif
