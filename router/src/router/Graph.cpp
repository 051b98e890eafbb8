#include "Graph.h"

#include <cmath>

namespace wayfinder { namespace router {
    Graph::Graph(std::vector<Node> nodes, std::vector<Edge> edges) :
        _nodes(std::move(nodes)), _edges(std::move(edges))
    {
        validateEdges(_nodes, _edges);

        // Add edge ids to nodes
        linkNodeEdgeIds(_nodes, _edges);
    }

    void Graph::validateEdges(const std::vector<Node>& nodes, const std::vector<Edge>& edges) {
        for (const Edge& edge : edges) {
            if (edge.nodeIds[0] >= nodes.size() || edge.nodeIds[1] >= nodes.size()) {
                throw std::out_of_range("Edge references a node that is not part of the graph");
            }
            if (!std::isfinite(edge.length) || edge.length < 0) {
                throw std::invalid_argument("Edge length must be finite and non-negative");
            }
        }
    }

    void Graph::linkNodeEdgeIds(std::vector<Node>& nodes, const std::vector<Edge>& edges) {
        for (std::size_t i = 0; i < nodes.size(); i++) {
            nodes[i].edgeIds.clear();
            nodes[i].edgeIds.reserve(3); // 3 should be optimal in most cases
        }
        for (std::size_t i = 0; i < edges.size(); i++) {
            const Edge& edge = edges[i];
            Node& node0 = nodes.at(edge.nodeIds[0]);
            node0.edgeIds.push_back(static_cast<EdgeId>(i));
        }
    }
} }
