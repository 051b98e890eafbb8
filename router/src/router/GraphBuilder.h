/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _WAYFINDER_ROUTER_GRAPHBUILDER_H_
#define _WAYFINDER_ROUTER_GRAPHBUILDER_H_

#include "Base.h"
#include "Graph.h"

#include <memory>
#include <array>
#include <vector>
#include <unordered_map>

#include <boost/functional/hash.hpp>

#include <picojson/picojson.h>

namespace wayfinder { namespace router {
    class GraphBuilder final {
    public:
        GraphBuilder() = default;

        Graph::NodeId addNode(const WGSPos& pos);
        void addEdge(Graph::NodeId nodeId0, Graph::NodeId nodeId1, double length, bool bidirectional = true);

        // Adds linestring vertices as nodes (vertices with identical coordinates are shared) and its segments as edges
        void addLineString(const std::vector<WGSPos>& coordsList, bool oneway = false);

        void importGeoJSON(const picojson::value& geoJSON);
        void importNodeLink(const picojson::value& nodeLinkDef);

        std::shared_ptr<Graph> build() const;

    private:
        void importGeoJSONFeatureCollection(const picojson::value& featureCollectionDef);
        void importGeoJSONFeature(const picojson::value& featureDef);
        void importGeoJSONGeometry(const picojson::value& geometryDef, bool oneway);

        Graph::NodeId addLineVertex(const WGSPos& pos);

        static bool isOneway(const picojson::value& onewayDef);

        static std::vector<WGSPos> parseCoordinatesList(const picojson::value& coordsDef);
        static WGSPos parseCoordinates(const picojson::value& coordsDef);
        static double parseNumber(const picojson::value& object, const std::string& key, const std::string& altKey);

        std::vector<Graph::Node> _nodes;
        std::vector<Graph::Edge> _edges;

        std::unordered_map<std::array<double, 2>, Graph::NodeId, boost::hash<std::array<double, 2>>> _coordsNodeIdMap;
    };
} }

#endif
