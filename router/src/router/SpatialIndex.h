/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _WAYFINDER_ROUTER_SPATIALINDEX_H_
#define _WAYFINDER_ROUTER_SPATIALINDEX_H_

#include "Base.h"
#include "Graph.h"

#include <memory>
#include <array>
#include <vector>

#include <cglib/vec.h>
#include <cglib/bbox.h>

namespace wayfinder { namespace router {
    // Nearest node lookup for a graph. Node positions are projected onto the unit sphere and
    // stored in a bounding box tree, so that the box distance is an exact lower bound of the chord
    // (and therefore great-circle) distance. Subtrees with at most 'leafSize' nodes are scanned linearly,
    // thus small graphs degrade to a simple linear scan.
    class SpatialIndex final {
    public:
        struct Options {
            std::size_t leafSize = 16;
        };

        SpatialIndex() = delete;
        explicit SpatialIndex(std::shared_ptr<const Graph> graph, const Options& options = Options());

        const std::shared_ptr<const Graph>& getGraph() const { return _graph; }
        const Options& getOptions() const { return _options; }

        // Returns the node closest to the given position. Ties are resolved by selecting the lowest node id.
        Graph::NodeId findNearestNode(const WGSPos& pos) const;

    private:
        static constexpr double DIST_EPSILON = 1.0e-9; // in km

        struct TreeNode {
            cglib::bbox3<double> bounds = cglib::bbox3<double>::smallest();
            std::vector<Graph::NodeId> nodeIds;
            std::array<std::shared_ptr<TreeNode>, 2> subNodes;
        };

        std::shared_ptr<TreeNode> buildTree(const cglib::bbox3<double>& bounds, std::vector<Graph::NodeId> nodeIds) const;

        const std::shared_ptr<const Graph> _graph;
        const Options _options;
        std::vector<cglib::vec3<double>> _points;
        std::shared_ptr<const TreeNode> _rootNode;
    };

    // One-off nearest node lookup. Builds a temporary index, so keep a SpatialIndex instance for repeated queries.
    Graph::NodeId findNearestNode(std::shared_ptr<const Graph> graph, const WGSPos& pos);
} }

#endif
