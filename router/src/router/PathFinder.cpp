#include "PathFinder.h"
#include "GeoUtils.h"

#include <queue>
#include <limits>
#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace wayfinder { namespace router {
    PathFinder::PathFinder(std::shared_ptr<const Graph> graph) :
        _graph(std::move(graph))
    {
        if (!_graph) {
            throw std::invalid_argument("Null graph");
        }
    }

    boost::optional<PathFinder::Path> PathFinder::findPath(Graph::NodeId startNodeId, Graph::NodeId goalNodeId, const CancelCallback& cancelCallback) const {
        struct NodeRecord {
            double estCost; // cost from start plus the estimated cost to goal
            double cost;    // cost from start
            Graph::NodeId nodeId;

            // Lowest estimated cost first, then the deepest node, then the lowest node id
            bool operator < (const NodeRecord& rec) const {
                if (estCost != rec.estCost) {
                    return rec.estCost < estCost;
                }
                if (cost != rec.cost) {
                    return cost < rec.cost;
                }
                return rec.nodeId < nodeId;
            }
        };

        struct NodeState {
            double cost = std::numeric_limits<double>::infinity();
            Graph::NodeId prevNodeId = Graph::NodeId(-1);
        };

        if (!_graph->hasNode(startNodeId)) {
            throw InvalidNodeException(startNodeId);
        }
        if (!_graph->hasNode(goalNodeId)) {
            throw InvalidNodeException(goalNodeId);
        }

        const WGSPos& goalPos = _graph->getNode(goalNodeId).pos;

        std::unordered_map<Graph::NodeId, NodeState> nodeStates;
        std::unordered_set<Graph::NodeId> closedNodeIds;
        std::priority_queue<NodeRecord> nodeQueue;

        nodeStates[startNodeId].cost = 0;
        nodeQueue.push({ calculateDistanceKm(_graph->getNode(startNodeId).pos, goalPos), 0.0, startNodeId });
        while (!nodeQueue.empty()) {
            NodeRecord rec = nodeQueue.top();
            nodeQueue.pop();

            // Skip stale records of already finalized nodes
            if (closedNodeIds.count(rec.nodeId) > 0) {
                continue;
            }

            if (cancelCallback && cancelCallback()) {
                throw SearchCancelledException();
            }

            closedNodeIds.insert(rec.nodeId);

            // Check if we have reached the goal, if so, build the path by following the links backwards
            if (rec.nodeId == goalNodeId) {
                Path path;
                path.cost = rec.cost;
                for (Graph::NodeId nodeId = goalNodeId; nodeId != Graph::NodeId(-1); nodeId = nodeStates[nodeId].prevNodeId) {
                    path.nodeIds.push_back(nodeId);
                }
                std::reverse(path.nodeIds.begin(), path.nodeIds.end());
                return path;
            }

            // Relax all outgoing edges
            const Graph::Node& node = _graph->getNode(rec.nodeId);
            for (Graph::EdgeId edgeId : node.edgeIds) {
                const Graph::Edge& edge = _graph->getEdge(edgeId);
                Graph::NodeId targetNodeId = edge.nodeIds[1];
                if (closedNodeIds.count(targetNodeId) > 0) {
                    continue;
                }

                double targetCost = rec.cost + edge.length / METERS_PER_KM;
                NodeState& targetState = nodeStates[targetNodeId];
                if (targetState.cost <= targetCost) {
                    continue;
                }

                targetState.cost = targetCost;
                targetState.prevNodeId = rec.nodeId;
                nodeQueue.push({ targetCost + calculateDistanceKm(_graph->getNode(targetNodeId).pos, goalPos), targetCost, targetNodeId });
            }
        }

        return boost::optional<Path>();
    }
} }
