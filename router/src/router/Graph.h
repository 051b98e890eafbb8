/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _WAYFINDER_ROUTER_GRAPH_H_
#define _WAYFINDER_ROUTER_GRAPH_H_

#include "Base.h"

#include <array>
#include <vector>
#include <string>
#include <stdexcept>

namespace wayfinder { namespace router {
    class Graph final {
    public:
        using NodeId = std::size_t;
        using EdgeId = std::size_t;

        struct Node {
            WGSPos pos = WGSPos(0, 0);              // node position
            std::vector<EdgeId> edgeIds;            // outward edge ids. Filled automatically when the graph is constructed.
        };

        struct Edge {
            std::array<NodeId, 2> nodeIds = {{ NodeId(-1), NodeId(-1) }}; // source and target nodes
            double length = 0;                      // edge length, in meters
        };

        Graph() = default;
        explicit Graph(std::vector<Node> nodes, std::vector<Edge> edges);

        NodeId getNodeIdRangeEnd() const { return static_cast<NodeId>(_nodes.size()); }
        EdgeId getEdgeIdRangeEnd() const { return static_cast<EdgeId>(_edges.size()); }

        bool empty() const { return _nodes.empty(); }
        bool hasNode(NodeId nodeId) const { return nodeId < _nodes.size(); }

        const Node& getNode(NodeId nodeId) const { return _nodes.at(nodeId); }
        const Edge& getEdge(EdgeId edgeId) const { return _edges.at(edgeId); }

    private:
        static void validateEdges(const std::vector<Node>& nodes, const std::vector<Edge>& edges);

        static void linkNodeEdgeIds(std::vector<Node>& nodes, const std::vector<Edge>& edges);

        std::vector<Node> _nodes;
        std::vector<Edge> _edges;
    };

    class GraphException : public std::runtime_error {
    public:
        explicit GraphException(const std::string& msg) : runtime_error(msg) { }
    };

    class EmptyGraphException : public GraphException {
    public:
        EmptyGraphException() : GraphException("Graph contains no nodes") { }
    };

    class InvalidNodeException : public GraphException {
    public:
        explicit InvalidNodeException(Graph::NodeId nodeId) : GraphException("Node " + std::to_string(nodeId) + " is not part of the graph"), _nodeId(nodeId) { }

        Graph::NodeId getNodeId() const { return _nodeId; }

    private:
        Graph::NodeId _nodeId;
    };
} }

#endif
