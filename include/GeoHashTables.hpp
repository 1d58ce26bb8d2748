#pragma once
#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

constexpr std::string_view BASE32_ALPHABET = "0123456789bcdefghjkmnpqrstuvwxyz";

// Smallest cell size encode() will refine to, about 1.1 mm at the equator.
constexpr double LAT_MAX_PRECISION = 0.00000001;
constexpr double LON_MAX_PRECISION = 0.00000001;

constexpr double MIN_LATITUDE = -90.0;
constexpr double MIN_LONGITUDE = -180.0;
constexpr double LATITUDE_HALF_RANGE = 90.0;
constexpr double LONGITUDE_HALF_RANGE = 180.0;

enum class Direction : int {
    NORTH = 0,
    EAST,
    SOUTH,
    WEST
};

constexpr std::size_t DIRECTION_COUNT = 4;

// Parity of the hash length the last character sits at.
enum Parity : std::size_t {
    PARITY_EVEN = 0,
    PARITY_ODD = 1
};

using DirectionTable = std::array<std::array<std::string_view, 2>, DIRECTION_COUNT>;

// NEIGHBOR_TABLES[dir][parity]: the alphabet position of a character in this
// string is the alphabet index of its same-level neighbor in that direction.
extern const DirectionTable NEIGHBOR_TABLES;

// BORDER_TABLES[dir][parity]: characters whose neighbor in that direction
// lies in the adjacent parent cell.
extern const DirectionTable BORDER_TABLES;

// Returns -1 for bytes outside the alphabet.
int alphabetIndex(char c);
bool isAlphabetChar(char c);

// Position of the first byte outside the alphabet, or npos.
std::size_t findInvalidChar(std::string_view hash);

bool isValidDirection(Direction dir);
Direction opposite(Direction dir);
std::string_view directionName(Direction dir);
std::optional<Direction> parseDirection(std::string_view name);

Parity parityOf(std::size_t length);
