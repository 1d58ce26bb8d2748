#include "GeoHash.hpp"
#include <cmath>
#include <utility>

namespace {

double wrapLatitude(double latitude) {
    return std::fmod(std::fmod(latitude - 90.0, 180.0) + 180.0, 180.0) - 90.0;
}

double wrapLongitude(double longitude) {
    return std::fmod(std::fmod(longitude - 180.0, 360.0) + 360.0, 360.0) - 180.0;
}

}

GeoHash GeoHash::encode(double latitude, double longitude, double latTolerance, double lonTolerance) {
    // NaN fails every comparison, so test for the acceptable range instead
    if (!(latTolerance >= LAT_MAX_PRECISION)) latTolerance = LAT_MAX_PRECISION;
    if (!(lonTolerance >= LON_MAX_PRECISION)) lonTolerance = LON_MAX_PRECISION;

    double latMin = MIN_LATITUDE;
    double latDelta = LATITUDE_HALF_RANGE;
    double lonMin = MIN_LONGITUDE;
    double lonDelta = LONGITUDE_HALF_RANGE;

    latitude = wrapLatitude(latitude);
    longitude = wrapLongitude(longitude);

    std::string out;
    int index = 0;
    int bit = 0x10;
    bool targetingLongitude = true;

    while (true) {
        if (targetingLongitude) {
            if (longitude > lonMin + lonDelta) {
                index |= bit;
                lonMin += lonDelta;
            }
        } else {
            if (latitude > latMin + latDelta) {
                index |= bit;
                latMin += latDelta;
            }
        }
        bit >>= 1;

        if (bit == 0) {
            out.push_back(BASE32_ALPHABET[index]);
            index = 0;
            bit = 0x10;

            if (latDelta <= latTolerance && lonDelta <= lonTolerance) break;
        }

        // both intervals shrink once per (longitude, latitude) pair
        if (!targetingLongitude) {
            lonDelta *= 0.5;
            latDelta *= 0.5;
        }
        targetingLongitude = !targetingLongitude;
    }

    return GeoHash(std::move(out));
}

GeoHash GeoHash::parse(std::string_view hash) {
    std::size_t pos = findInvalidChar(hash);
    if (pos != std::string_view::npos) {
        throw InvalidCharacterError(hash[pos], pos);
    }
    return GeoHash(std::string(hash));
}

std::optional<GeoHash> GeoHash::tryParse(std::string_view hash) {
    if (findInvalidChar(hash) != std::string_view::npos) return std::nullopt;
    return GeoHash(std::string(hash));
}

BoundingBox GeoHash::decode() const {
    BoundingBox box{MIN_LATITUDE, LATITUDE_HALF_RANGE, MIN_LONGITUDE, LONGITUDE_HALF_RANGE};

    for (std::size_t i = 0; i < hash.size(); ++i) {
        int index = alphabetIndex(hash[i]);

        // even positions start on longitude, odd ones on latitude
        bool targetingLongitude = (i % 2 == 0);
        for (int bit = 0x10; bit != 0; bit >>= 1) {
            if (targetingLongitude) {
                if (index & bit) box.lonMin += box.lonDelta;
                box.lonDelta *= 0.5;
            } else {
                if (index & bit) box.latMin += box.latDelta;
                box.latDelta *= 0.5;
            }
            targetingLongitude = !targetingLongitude;
        }
    }
    return box;
}

GeoHash GeoHash::neighbor(Direction dir) const {
    if (!isValidDirection(dir)) {
        throw InvalidDirectionError(static_cast<int>(dir));
    }
    return GeoHash(stepNeighbor(hash, dir));
}

GeoHash GeoHash::neighbor(std::string_view hash, Direction dir) {
    if (!isValidDirection(dir)) {
        throw InvalidDirectionError(static_cast<int>(dir));
    }
    return parse(hash).neighbor(dir);
}

// Stepping past an empty prefix yields an empty prefix, so a step off the
// top-level grid wraps to the opposite edge of it.
std::string GeoHash::stepNeighbor(std::string_view hash, Direction dir) {
    if (hash.empty()) return {};

    std::string_view base = hash.substr(0, hash.size() - 1);
    char last = hash.back();
    Parity parity = parityOf(hash.size());
    auto d = static_cast<std::size_t>(dir);

    std::string prefix;
    if (BORDER_TABLES[d][parity].find(last) != std::string_view::npos) {
        prefix = stepNeighbor(base, dir);
    } else {
        prefix = std::string(base);
    }

    prefix.push_back(BASE32_ALPHABET[NEIGHBOR_TABLES[d][parity].find(last)]);
    return prefix;
}

std::ostream& operator<<(std::ostream& os, const GeoHash& gh) {
    return os << gh.str();
}
