/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _WAYFINDER_ROUTER_QUERY_H_
#define _WAYFINDER_ROUTER_QUERY_H_

#include "Base.h"
#include "TravelMode.h"

#include <array>

#include <boost/optional.hpp>

#include <picojson/picojson.h>

namespace wayfinder { namespace router {
    class Query final {
    public:
        Query() = delete;
        explicit Query(const WGSPos& pos0, const WGSPos& pos1, TravelMode mode = TravelMode::WALK, const boost::optional<int>& hour = boost::optional<int>()) : _points {{ pos0, pos1 }}, _mode(mode), _hour(hour) { }

        WGSPos getPos(int index) const { return _points.at(index); }
        void setPos(int index, const WGSPos& pos) { _points.at(index) = pos; }
        TravelMode getMode() const { return _mode; }
        void setMode(TravelMode mode) { _mode = mode; }
        const boost::optional<int>& getHour() const { return _hour; }
        void setHour(const boost::optional<int>& hour) { _hour = hour; }

        picojson::value serialize() const;

        static Query parse(const picojson::value& queryDef);

    private:
        std::array<WGSPos, 2> _points;
        TravelMode _mode;
        boost::optional<int> _hour;
    };
} }

#endif
