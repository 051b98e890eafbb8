#include "GraphCache.h"

#include <stdexcept>

namespace wayfinder { namespace router {
    std::shared_ptr<const Graph> GraphCache::get(const std::string& place, const std::string& networkType) {
        std::lock_guard<std::mutex> lock(_mutex);

        Key key(place, networkType);
        auto it = _graphs.find(key);
        if (it != _graphs.end()) {
            return it->second;
        }

        // The lock is kept while loading, so concurrent requests for the same graph trigger only a single load
        std::shared_ptr<const Graph> graph;
        try {
            graph = _loader(place, networkType);
            if (!graph) {
                throw std::runtime_error("Graph loader returned no graph");
            }
        } catch (const std::exception& ex) {
            if (_logger) {
                _logger->write(Logger::Severity::ERROR, "Failed to load graph for " + place + " (" + networkType + "): " + ex.what());
            }
            throw;
        }

        if (_logger) {
            _logger->write(Logger::Severity::INFO, "Loaded graph for " + place + " (" + networkType + ") with " + std::to_string(graph->getNodeIdRangeEnd()) + " nodes");
        }
        _graphs[key] = graph;
        return graph;
    }

    bool GraphCache::contains(const std::string& place, const std::string& networkType) const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _graphs.count(Key(place, networkType)) > 0;
    }

    std::size_t GraphCache::size() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _graphs.size();
    }

    bool GraphCache::invalidate(const std::string& place, const std::string& networkType) {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_graphs.erase(Key(place, networkType)) == 0) {
            return false;
        }
        if (_logger) {
            _logger->write(Logger::Severity::INFO, "Invalidated graph for " + place + " (" + networkType + ")");
        }
        return true;
    }

    void GraphCache::clear() {
        std::lock_guard<std::mutex> lock(_mutex);
        _graphs.clear();
    }
} }
