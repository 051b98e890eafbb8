/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _WAYFINDER_ROUTER_BASE_H_
#define _WAYFINDER_ROUTER_BASE_H_

#include <string>
#include <functional>

#include <cglib/vec.h>

#include <picojson/picojson.h>

namespace wayfinder { namespace router {
    using WGSPos = cglib::vec2<double>; // longitude, latitude (in degrees)
} }

namespace std {
    template <>
    struct hash<picojson::value> {
        size_t operator() (const picojson::value& val) const {
            return hash<string>()(val.serialize());
        }
    };
}

#endif
