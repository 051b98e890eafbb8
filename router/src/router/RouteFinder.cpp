#include "RouteFinder.h"
#include "GeoUtils.h"
#include "RouteBuilder.h"
#include "TrafficModel.h"

#include <cstdint>
#include <stdexcept>

namespace wayfinder { namespace router {
    RouteFinder::RouteFinder(std::shared_ptr<const Graph> graph, const RouteOptions& routeOptions, std::shared_ptr<Logger> logger) :
        _graph(graph), _routeOptions(routeOptions), _spatialIndex(graph, getSpatialIndexOptions(routeOptions)), _pathFinder(graph), _logger(std::move(logger))
    {
    }

    Result RouteFinder::find(const Query& query, const PathFinder::CancelCallback& cancelCallback) const {
        for (int i = 0; i < 2; i++) {
            if (!isValidPos(query.getPos(i))) {
                throw std::invalid_argument("Invalid query position");
            }
        }
        if (query.getHour() && (*query.getHour() < 0 || *query.getHour() > 23)) {
            throw std::out_of_range("Hour of day must be in range 0..23");
        }

        // Snap both endpoints to the graph
        Graph::NodeId startNodeId = _spatialIndex.findNearestNode(query.getPos(0));
        Graph::NodeId goalNodeId = _spatialIndex.findNearestNode(query.getPos(1));

        boost::optional<PathFinder::Path> path = _pathFinder.findPath(startNodeId, goalNodeId, cancelCallback);
        if (!path) {
            if (_logger) {
                _logger->write(Logger::Severity::WARNING, "No path found from node " + std::to_string(startNodeId) + " to node " + std::to_string(goalNodeId));
            }
            return Result();
        }

        Route route = RouteBuilder::build(*_graph, path->nodeIds, query.getMode());

        // Traffic is applied to the displayed (rounded) time
        boost::optional<TrafficEstimate> trafficEstimate;
        if (_routeOptions.traffic && query.getHour()) {
            trafficEstimate = TrafficModel::adjust(static_cast<double>(route.getDisplayTime()), *query.getHour());
        }

        boost::optional<double> fuelConsumption = route.getFuelConsumption(_routeOptions.fuelConsumption);
        return Result(std::move(route), std::move(trafficEstimate), fuelConsumption);
    }

    std::unique_ptr<RouteFinder> RouteFinder::create(std::shared_ptr<const Graph> graph, const picojson::value& configDef, std::shared_ptr<Logger> logger) {
        RouteOptions routeOptions;
        if (configDef.contains("traffic")) {
            routeOptions.traffic = configDef.get("traffic").get<bool>();
        }
        if (configDef.contains("fuelconsumption")) {
            routeOptions.fuelConsumption = configDef.get("fuelconsumption").get<double>();
            if (routeOptions.fuelConsumption < 0) {
                throw std::invalid_argument("Negative fuel consumption");
            }
        }
        if (configDef.contains("leafsize")) {
            std::int64_t leafSize = configDef.get("leafsize").get<std::int64_t>();
            if (leafSize < 1) {
                throw std::invalid_argument("Leaf size must be positive");
            }
            routeOptions.leafSize = static_cast<std::size_t>(leafSize);
        }

        return std::unique_ptr<RouteFinder>(new RouteFinder(std::move(graph), routeOptions, std::move(logger)));
    }

    SpatialIndex::Options RouteFinder::getSpatialIndexOptions(const RouteOptions& routeOptions) {
        SpatialIndex::Options options;
        options.leafSize = routeOptions.leafSize;
        return options;
    }
} }
