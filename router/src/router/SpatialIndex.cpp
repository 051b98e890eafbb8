#include "SpatialIndex.h"
#include "GeoUtils.h"

#include <queue>
#include <limits>
#include <algorithm>

namespace wayfinder { namespace router {
    SpatialIndex::SpatialIndex(std::shared_ptr<const Graph> graph, const Options& options) :
        _graph(std::move(graph)), _options(options)
    {
        if (!_graph) {
            throw std::invalid_argument("Null graph");
        }
        if (_options.leafSize < 1) {
            throw std::invalid_argument("Leaf size must be positive");
        }

        cglib::bbox3<double> bounds = cglib::bbox3<double>::smallest();
        std::vector<Graph::NodeId> nodeIds;
        nodeIds.reserve(_graph->getNodeIdRangeEnd());
        _points.reserve(_graph->getNodeIdRangeEnd());
        for (Graph::NodeId nodeId = 0; nodeId < _graph->getNodeIdRangeEnd(); nodeId++) {
            cglib::vec3<double> point = projectToUnitSphere(_graph->getNode(nodeId).pos);
            bounds.add(point);
            _points.push_back(point);
            nodeIds.push_back(nodeId);
        }
        if (!nodeIds.empty()) {
            _rootNode = buildTree(bounds, std::move(nodeIds));
        }
    }

    Graph::NodeId SpatialIndex::findNearestNode(const WGSPos& pos) const {
        struct TreeNodeRecord {
            std::shared_ptr<const TreeNode> node;
            double dist;

            bool operator < (const TreeNodeRecord& rec) const { return rec.dist < dist; }
        };

        if (!_rootNode) {
            throw EmptyGraphException();
        }

        cglib::vec3<double> point = projectToUnitSphere(pos);
        auto calculateBoundsDistance = [&point](const cglib::bbox3<double>& bounds) {
            return chordLengthToDistanceKm(cglib::length(bounds.nearest_point(point) - point));
        };

        double bestDist = std::numeric_limits<double>::infinity();
        Graph::NodeId bestNodeId = Graph::NodeId(-1);

        // Start from the root node and visit subtrees in the order of their distance. Stop once no subtree can contain a closer node.
        std::priority_queue<TreeNodeRecord> nodeQueue;
        nodeQueue.push({ _rootNode, calculateBoundsDistance(_rootNode->bounds) });
        while (!nodeQueue.empty()) {
            std::shared_ptr<const TreeNode> node = nodeQueue.top().node;
            double dist = nodeQueue.top().dist;
            nodeQueue.pop();

            if (dist > bestDist + DIST_EPSILON) {
                break;
            }

            for (const std::shared_ptr<TreeNode>& subNode : node->subNodes) {
                if (subNode) {
                    nodeQueue.push({ subNode, calculateBoundsDistance(subNode->bounds) });
                }
            }

            for (Graph::NodeId nodeId : node->nodeIds) {
                double nodeDist = calculateDistanceKm(pos, _graph->getNode(nodeId).pos);
                if (nodeDist + DIST_EPSILON < bestDist || (nodeDist <= bestDist + DIST_EPSILON && nodeId < bestNodeId)) {
                    bestDist = std::min(bestDist, nodeDist);
                    bestNodeId = nodeId;
                }
            }
        }
        return bestNodeId;
    }

    std::shared_ptr<SpatialIndex::TreeNode> SpatialIndex::buildTree(const cglib::bbox3<double>& bounds, std::vector<Graph::NodeId> nodeIds) const {
        // Create non-leaf nodes?
        if (nodeIds.size() > _options.leafSize) {
            cglib::bbox3<double> splitBounds[3][2];
            std::vector<Graph::NodeId> splitNodeIds[3][2];
            for (int dim = 0; dim < 3; dim++) {
                splitBounds[dim][0] = splitBounds[dim][1] = cglib::bbox3<double>::smallest();
            }

            // Split by comparing each point to the center of the parent
            cglib::vec3<double> center = bounds.center();
            for (Graph::NodeId nodeId : nodeIds) {
                const cglib::vec3<double>& point = _points[nodeId];
                for (int dim = 0; dim < 3; dim++) {
                    int idx = point(dim) < center(dim) ? 0 : 1;
                    splitBounds[dim][idx].add(point);
                    splitNodeIds[dim][idx].push_back(nodeId);
                }
            }

            // Find the most balanced splitting dimension
            int bestDim = 0;
            for (int dim = 1; dim < 3; dim++) {
                if (std::min(splitNodeIds[dim][0].size(), splitNodeIds[dim][1].size()) > std::min(splitNodeIds[bestDim][0].size(), splitNodeIds[bestDim][1].size())) {
                    bestDim = dim;
                }
            }

            // Coincident points can not be split, in that case fall through and create a leaf
            if (!splitNodeIds[bestDim][0].empty() && !splitNodeIds[bestDim][1].empty()) {
                auto node = std::make_shared<TreeNode>();
                node->bounds = bounds;
                node->subNodes[0] = buildTree(splitBounds[bestDim][0], std::move(splitNodeIds[bestDim][0]));
                node->subNodes[1] = buildTree(splitBounds[bestDim][1], std::move(splitNodeIds[bestDim][1]));
                return node;
            }
        }

        // Create final leaf node
        auto node = std::make_shared<TreeNode>();
        node->bounds = bounds;
        node->nodeIds = std::move(nodeIds);
        return node;
    }

    Graph::NodeId findNearestNode(std::shared_ptr<const Graph> graph, const WGSPos& pos) {
        return SpatialIndex(std::move(graph)).findNearestNode(pos);
    }
} }
