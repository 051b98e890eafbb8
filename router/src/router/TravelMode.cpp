#include "TravelMode.h"

#include <stdexcept>

namespace wayfinder { namespace router {
    double getReferenceSpeed(TravelMode mode) {
        switch (mode) {
        case TravelMode::CAR:
            return 50.0;
        case TravelMode::WALK:
            return 5.0;
        case TravelMode::BIKE:
            return 15.0;
        }
        throw std::invalid_argument("Illegal travel mode");
    }

    std::string getNetworkType(TravelMode mode) {
        return mode == TravelMode::CAR ? "drive" : "walk";
    }

    std::string getTravelModeName(TravelMode mode) {
        switch (mode) {
        case TravelMode::CAR:
            return "car";
        case TravelMode::WALK:
            return "walk";
        case TravelMode::BIKE:
            return "bike";
        }
        throw std::invalid_argument("Illegal travel mode");
    }

    TravelMode parseTravelMode(const std::string& name) {
        if (name == "car") {
            return TravelMode::CAR;
        } else if (name == "walk") {
            return TravelMode::WALK;
        } else if (name == "bike") {
            return TravelMode::BIKE;
        }
        throw std::invalid_argument("Illegal travel mode value: " + name);
    }
} }
