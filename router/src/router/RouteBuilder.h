/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _WAYFINDER_ROUTER_ROUTEBUILDER_H_
#define _WAYFINDER_ROUTER_ROUTEBUILDER_H_

#include "Graph.h"
#include "Route.h"
#include "TravelMode.h"

#include <vector>

namespace wayfinder { namespace router {
    class RouteBuilder final {
    public:
        RouteBuilder() = delete;

        // Builds route geometry and estimates. Distance is measured along the geometry, not taken from the edge lengths.
        static Route build(const Graph& graph, const std::vector<Graph::NodeId>& nodeIds, TravelMode mode);
    };
} }

#endif
