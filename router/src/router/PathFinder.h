/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _WAYFINDER_ROUTER_PATHFINDER_H_
#define _WAYFINDER_ROUTER_PATHFINDER_H_

#include "Base.h"
#include "Graph.h"

#include <memory>
#include <vector>
#include <functional>
#include <stdexcept>

#include <boost/optional.hpp>

namespace wayfinder { namespace router {
    class SearchCancelledException : public std::runtime_error {
    public:
        SearchCancelledException() : runtime_error("Path search cancelled") { }
    };

    // A* shortest path search over edge lengths, using great-circle distance to the goal as the heuristic.
    // The search keeps all of its state local, so a single instance can be used from multiple threads.
    class PathFinder final {
    public:
        using CancelCallback = std::function<bool()>;

        struct Path {
            std::vector<Graph::NodeId> nodeIds;     // nodes from start to goal, both inclusive
            double cost = 0;                        // sum of edge lengths, in km
        };

        PathFinder() = delete;
        explicit PathFinder(std::shared_ptr<const Graph> graph);

        const std::shared_ptr<const Graph>& getGraph() const { return _graph; }

        // Returns the shortest path or an empty optional if the goal is not reachable.
        // The cancel callback is polled once per node expansion, SearchCancelledException is thrown if it returns true.
        boost::optional<Path> findPath(Graph::NodeId startNodeId, Graph::NodeId goalNodeId, const CancelCallback& cancelCallback = CancelCallback()) const;

    private:
        static constexpr double METERS_PER_KM = 1000.0;

        const std::shared_ptr<const Graph> _graph;
    };
} }

#endif
