/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _WAYFINDER_ROUTER_GRAPHCACHE_H_
#define _WAYFINDER_ROUTER_GRAPHCACHE_H_

#include "Graph.h"
#include "Logger.h"

#include <memory>
#include <mutex>
#include <map>
#include <string>
#include <utility>
#include <functional>

namespace wayfinder { namespace router {
    // Keeps loaded graphs by place name and network type. Graphs are loaded once and are kept until explicitly invalidated.
    class GraphCache final {
    public:
        using GraphLoader = std::function<std::shared_ptr<const Graph>(const std::string& place, const std::string& networkType)>;

        GraphCache() = delete;
        explicit GraphCache(GraphLoader loader, std::shared_ptr<Logger> logger = std::shared_ptr<Logger>()) : _loader(std::move(loader)), _logger(std::move(logger)) { }

        std::shared_ptr<const Graph> get(const std::string& place, const std::string& networkType);

        bool contains(const std::string& place, const std::string& networkType) const;
        std::size_t size() const;

        bool invalidate(const std::string& place, const std::string& networkType);
        void clear();

    private:
        using Key = std::pair<std::string, std::string>;

        const GraphLoader _loader;
        const std::shared_ptr<Logger> _logger;

        std::map<Key, std::shared_ptr<const Graph>> _graphs;
        mutable std::mutex _mutex;
    };
} }

#endif
