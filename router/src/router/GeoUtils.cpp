#include "GeoUtils.h"

#include <cmath>
#include <algorithm>

#include <boost/math/constants/constants.hpp>

namespace {
    double toRadians(double deg) {
        return deg * boost::math::constants::pi<double>() / 180.0;
    }
}

namespace wayfinder { namespace router {
    bool isValidPos(const WGSPos& pos) {
        return std::isfinite(pos(0)) && std::isfinite(pos(1)) && pos(0) >= -180.0 && pos(0) <= 180.0 && pos(1) >= -90.0 && pos(1) <= 90.0;
    }

    double calculateDistanceKm(const WGSPos& pos0, const WGSPos& pos1) {
        double lat0 = toRadians(pos0(1));
        double lat1 = toRadians(pos1(1));
        double sinDLat = std::sin((lat1 - lat0) * 0.5);
        double sinDLng = std::sin(toRadians(pos1(0) - pos0(0)) * 0.5);

        double a = sinDLat * sinDLat + std::cos(lat0) * std::cos(lat1) * sinDLng * sinDLng;
        return 2.0 * EARTH_RADIUS_KM * std::asin(std::min(1.0, std::sqrt(a)));
    }

    cglib::vec3<double> projectToUnitSphere(const WGSPos& pos) {
        double lng = toRadians(pos(0));
        double lat = toRadians(pos(1));
        return cglib::vec3<double>(std::cos(lat) * std::cos(lng), std::cos(lat) * std::sin(lng), std::sin(lat));
    }

    double chordLengthToDistanceKm(double chordLength) {
        return 2.0 * EARTH_RADIUS_KM * std::asin(std::min(1.0, std::max(0.0, chordLength * 0.5)));
    }
} }
