#include "RouteBuilder.h"
#include "GeoUtils.h"

#include <stdexcept>

namespace wayfinder { namespace router {
    Route RouteBuilder::build(const Graph& graph, const std::vector<Graph::NodeId>& nodeIds, TravelMode mode) {
        if (nodeIds.empty()) {
            throw std::invalid_argument("Empty node path");
        }

        std::vector<WGSPos> geometry;
        geometry.reserve(nodeIds.size());
        double distance = 0;
        for (Graph::NodeId nodeId : nodeIds) {
            if (!graph.hasNode(nodeId)) {
                throw InvalidNodeException(nodeId);
            }
            const WGSPos& pos = graph.getNode(nodeId).pos;
            if (!geometry.empty()) {
                distance += calculateDistanceKm(geometry.back(), pos);
            }
            geometry.push_back(pos);
        }

        double time = distance / getReferenceSpeed(mode) * 60.0;
        return Route(mode, nodeIds, std::move(geometry), distance, time);
    }
} }
