/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _WAYFINDER_ROUTER_TRAVELMODE_H_
#define _WAYFINDER_ROUTER_TRAVELMODE_H_

#include <string>

namespace wayfinder { namespace router {
    enum class TravelMode {
        CAR  = 0,
        WALK = 1,
        BIKE = 2
    };

    double getReferenceSpeed(TravelMode mode); // in km/h

    std::string getNetworkType(TravelMode mode);

    std::string getTravelModeName(TravelMode mode);

    TravelMode parseTravelMode(const std::string& name);
} }

#endif
