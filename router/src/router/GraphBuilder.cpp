#include "GraphBuilder.h"
#include "GeoUtils.h"

#include <cstdint>
#include <stdexcept>

namespace wayfinder { namespace router {
    Graph::NodeId GraphBuilder::addNode(const WGSPos& pos) {
        if (!isValidPos(pos)) {
            throw std::invalid_argument("Invalid node coordinates");
        }
        Graph::Node node;
        node.pos = pos;
        _nodes.push_back(node);
        return static_cast<Graph::NodeId>(_nodes.size() - 1);
    }

    void GraphBuilder::addEdge(Graph::NodeId nodeId0, Graph::NodeId nodeId1, double length, bool bidirectional) {
        Graph::Edge edge;
        edge.nodeIds = std::array<Graph::NodeId, 2> {{ nodeId0, nodeId1 }};
        edge.length = length;
        _edges.push_back(edge);

        if (bidirectional) {
            std::swap(edge.nodeIds[0], edge.nodeIds[1]);
            _edges.push_back(edge);
        }
    }

    void GraphBuilder::addLineString(const std::vector<WGSPos>& coordsList, bool oneway) {
        Graph::NodeId prevNodeId = Graph::NodeId(-1);
        for (std::size_t i = 0; i < coordsList.size(); i++) {
            Graph::NodeId nodeId = addLineVertex(coordsList[i]);
            if (i > 0 && nodeId != prevNodeId) {
                double length = calculateDistanceKm(coordsList[i - 1], coordsList[i]) * 1000.0;
                addEdge(prevNodeId, nodeId, length, !oneway);
            }
            prevNodeId = nodeId;
        }
    }

    void GraphBuilder::importGeoJSON(const picojson::value& geoJSON) {
        std::string type = geoJSON.get("type").get<std::string>();
        if (type == "FeatureCollection") {
            importGeoJSONFeatureCollection(geoJSON);
        } else if (type == "Feature") {
            importGeoJSONFeature(geoJSON);
        } else {
            throw std::runtime_error("Unexpected element type");
        }
    }

    void GraphBuilder::importNodeLink(const picojson::value& nodeLinkDef) {
        bool directed = nodeLinkDef.contains("directed") && nodeLinkDef.get("directed").get<bool>();

        // Node ids are local to the document and are mapped to dense graph node ids
        std::unordered_map<picojson::value, Graph::NodeId> nodeIdMap;
        for (const picojson::value& nodeDef : nodeLinkDef.get("nodes").get<picojson::array>()) {
            const picojson::value& idDef = nodeDef.get("id");
            if (nodeIdMap.count(idDef) > 0) {
                throw std::runtime_error("Duplicate node id " + idDef.serialize());
            }
            WGSPos pos(parseNumber(nodeDef, "lon", "x"), parseNumber(nodeDef, "lat", "y"));
            nodeIdMap[idDef] = addNode(pos);
        }

        const std::string linksKey = nodeLinkDef.contains("edges") ? "edges" : "links";
        for (const picojson::value& linkDef : nodeLinkDef.get(linksKey).get<picojson::array>()) {
            std::array<Graph::NodeId, 2> nodeIds;
            for (int i = 0; i < 2; i++) {
                const picojson::value& idDef = linkDef.get(i == 0 ? "source" : "target");
                auto it = nodeIdMap.find(idDef);
                if (it == nodeIdMap.end()) {
                    throw std::runtime_error("Edge references unknown node id " + idDef.serialize());
                }
                nodeIds[i] = it->second;
            }

            double length = 0;
            if (linkDef.contains("length")) {
                length = linkDef.get("length").get<double>();
            } else {
                length = calculateDistanceKm(_nodes[nodeIds[0]].pos, _nodes[nodeIds[1]].pos) * 1000.0;
            }

            bool oneway = directed || (linkDef.contains("oneway") && isOneway(linkDef.get("oneway")));
            addEdge(nodeIds[0], nodeIds[1], length, !oneway);
        }
    }

    std::shared_ptr<Graph> GraphBuilder::build() const {
        return std::make_shared<Graph>(_nodes, _edges);
    }

    void GraphBuilder::importGeoJSONFeatureCollection(const picojson::value& featureCollectionDef) {
        const picojson::array& featuresDef = featureCollectionDef.get("features").get<picojson::array>();

        for (const picojson::value& featureDef : featuresDef) {
            std::string type = featureDef.get("type").get<std::string>();
            if (type != "Feature") {
                throw std::runtime_error("Unexpected element type");
            }

            importGeoJSONFeature(featureDef);
        }
    }

    void GraphBuilder::importGeoJSONFeature(const picojson::value& featureDef) {
        const picojson::value& geometryDef = featureDef.get("geometry");
        if (geometryDef.is<picojson::null>()) {
            return;
        }

        bool oneway = false;
        const picojson::value& properties = featureDef.get("properties");
        if (properties.is<picojson::object>() && properties.contains("oneway")) {
            oneway = isOneway(properties.get("oneway"));
        }

        importGeoJSONGeometry(geometryDef, oneway);
    }

    void GraphBuilder::importGeoJSONGeometry(const picojson::value& geometryDef, bool oneway) {
        std::string type = geometryDef.get("type").get<std::string>();
        const picojson::value& coordsDef = geometryDef.get("coordinates");

        if (type == "LineString") {
            addLineString(parseCoordinatesList(coordsDef), oneway);
        } else if (type == "MultiLineString") {
            for (const picojson::value& subCoordsDef : coordsDef.get<picojson::array>()) {
                addLineString(parseCoordinatesList(subCoordsDef), oneway);
            }
        } else if (type == "Point" || type == "MultiPoint" || type == "Polygon" || type == "MultiPolygon") {
            // Can ignore
        } else {
            throw std::runtime_error("Invalid geometry type");
        }
    }

    Graph::NodeId GraphBuilder::addLineVertex(const WGSPos& pos) {
        std::array<double, 2> coords = {{ pos(0), pos(1) }};
        auto it = _coordsNodeIdMap.find(coords);
        if (it != _coordsNodeIdMap.end()) {
            return it->second;
        }
        Graph::NodeId nodeId = addNode(pos);
        _coordsNodeIdMap[coords] = nodeId;
        return nodeId;
    }

    bool GraphBuilder::isOneway(const picojson::value& onewayDef) {
        if (onewayDef.is<bool>()) {
            return onewayDef.get<bool>();
        } else if (onewayDef.is<std::int64_t>()) {
            return onewayDef.get<std::int64_t>() == 1;
        } else if (onewayDef.is<std::string>()) {
            std::string value = onewayDef.get<std::string>();
            return value == "yes" || value == "true" || value == "1";
        }
        return false;
    }

    std::vector<WGSPos> GraphBuilder::parseCoordinatesList(const picojson::value& coordsDef) {
        std::vector<WGSPos> coordsList;
        for (const picojson::value& subCoordsDef : coordsDef.get<picojson::array>()) {
            coordsList.push_back(parseCoordinates(subCoordsDef));
        }
        return coordsList;
    }

    WGSPos GraphBuilder::parseCoordinates(const picojson::value& coordsDef) {
        const picojson::array& coordsArray = coordsDef.get<picojson::array>();
        if (coordsArray.size() < 2) {
            throw std::runtime_error("Invalid coordinates");
        }
        return WGSPos(coordsArray[0].get<double>(), coordsArray[1].get<double>());
    }

    double GraphBuilder::parseNumber(const picojson::value& object, const std::string& key, const std::string& altKey) {
        if (object.contains(key)) {
            return object.get(key).get<double>();
        } else if (object.contains(altKey)) {
            return object.get(altKey).get<double>();
        }
        throw std::runtime_error("Missing '" + key + "' value");
    }
} }
