/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _WAYFINDER_ROUTER_GEOUTILS_H_
#define _WAYFINDER_ROUTER_GEOUTILS_H_

#include "Base.h"

namespace wayfinder { namespace router {
    static constexpr double EARTH_RADIUS_KM = 6371.0088; // mean earth radius

    bool isValidPos(const WGSPos& pos);

    // Great-circle (haversine) distance between two positions, in kilometers.
    double calculateDistanceKm(const WGSPos& pos0, const WGSPos& pos1);

    // Maps a position to a point on the unit sphere. Chord length between two such points is monotonic in great-circle distance.
    cglib::vec3<double> projectToUnitSphere(const WGSPos& pos);

    double chordLengthToDistanceKm(double chordLength);
} }

#endif
