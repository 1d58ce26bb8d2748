#pragma once
#include "GeoHashTables.hpp"
#include "GeoHashErrors.hpp"
#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

// Cell decoded from a GeoHash. The deltas are what the bisection leaves
// behind, half the cell's extent on each axis.
struct BoundingBox {
    double latMin;
    double latDelta;
    double lonMin;
    double lonDelta;

    double latMax() const { return latMin + 2.0 * latDelta; }
    double lonMax() const { return lonMin + 2.0 * lonDelta; }
    double centerLatitude() const { return latMin + latDelta; }
    double centerLongitude() const { return lonMin + lonDelta; }

    // Both bounds are inclusive: encode() sends points on a split line to
    // the lower half.
    bool contains(double latitude, double longitude) const {
        return latitude >= latMin && latitude <= latMax() &&
               longitude >= lonMin && longitude <= lonMax();
    }
};

// Immutable; only ever holds BASE32_ALPHABET characters.
class GeoHash {
public:
    GeoHash() = default;

    // Wraps the coordinate and floors the tolerances to *_MAX_PRECISION.
    static GeoHash encode(double latitude, double longitude, double latTolerance, double lonTolerance);

    // Throws InvalidCharacterError.
    static GeoHash parse(std::string_view hash);
    static std::optional<GeoHash> tryParse(std::string_view hash);

    BoundingBox decode() const;

    // Adjacent cell at the same length. Throws InvalidDirectionError.
    GeoHash neighbor(Direction dir) const;

    // Validates the direction, then the hash, before stepping.
    static GeoHash neighbor(std::string_view hash, Direction dir);

    const std::string& str() const { return hash; }
    std::size_t size() const { return hash.size(); }
    bool empty() const { return hash.empty(); }

    bool operator==(const GeoHash& other) const { return hash == other.hash; }
    bool operator!=(const GeoHash& other) const { return hash != other.hash; }
    bool operator<(const GeoHash& other) const { return hash < other.hash; }

private:
    explicit GeoHash(std::string value) : hash(std::move(value)) {}

    static std::string stepNeighbor(std::string_view hash, Direction dir);

    std::string hash;
};

std::ostream& operator<<(std::ostream& os, const GeoHash& gh);
