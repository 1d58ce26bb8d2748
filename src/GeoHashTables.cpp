#include "GeoHashTables.hpp"
#include "GeoHashErrors.hpp"
#include <cctype>
#include <string>

const DirectionTable NEIGHBOR_TABLES = {{
    // NORTH
    {{ "p0r21436x8zb9dcf5h7kjnmqesgutwvy", "bc01fg45238967deuvhjyznpkmstqrwx" }},
    // EAST
    {{ "bc01fg45238967deuvhjyznpkmstqrwx", "p0r21436x8zb9dcf5h7kjnmqesgutwvy" }},
    // SOUTH
    {{ "14365h7k9dcfesgujnmqp0r2twvyx8zb", "238967debc01fg45kmstqrwxuvhjyznp" }},
    // WEST
    {{ "238967debc01fg45kmstqrwxuvhjyznp", "14365h7k9dcfesgujnmqp0r2twvyx8zb" }},
}};

const DirectionTable BORDER_TABLES = {{
    {{ "prxz", "bcfguvyz" }},
    {{ "bcfguvyz", "prxz" }},
    {{ "028b", "0145hjnp" }},
    {{ "0145hjnp", "028b" }},
}};

namespace {

constexpr std::array<int, 256> buildReverseAlphabet() {
    std::array<int, 256> table{};
    for (auto& entry : table) entry = -1;
    for (std::size_t i = 0; i < BASE32_ALPHABET.size(); ++i) {
        table[static_cast<unsigned char>(BASE32_ALPHABET[i])] = static_cast<int>(i);
    }
    return table;
}

constexpr std::array<int, 256> REVERSE_ALPHABET = buildReverseAlphabet();

}

int alphabetIndex(char c) {
    return REVERSE_ALPHABET[static_cast<unsigned char>(c)];
}

bool isAlphabetChar(char c) {
    return alphabetIndex(c) >= 0;
}

std::size_t findInvalidChar(std::string_view hash) {
    for (std::size_t i = 0; i < hash.size(); ++i) {
        if (!isAlphabetChar(hash[i])) return i;
    }
    return std::string_view::npos;
}

bool isValidDirection(Direction dir) {
    int value = static_cast<int>(dir);
    return value >= static_cast<int>(Direction::NORTH) && value <= static_cast<int>(Direction::WEST);
}

Direction opposite(Direction dir) {
    if (!isValidDirection(dir)) {
        throw InvalidDirectionError(static_cast<int>(dir));
    }
    return static_cast<Direction>((static_cast<int>(dir) + 2) % 4);
}

std::string_view directionName(Direction dir) {
    switch (dir) {
        case Direction::NORTH: return "NORTH";
        case Direction::EAST:  return "EAST";
        case Direction::SOUTH: return "SOUTH";
        case Direction::WEST:  return "WEST";
    }
    return "UNKNOWN";
}

std::optional<Direction> parseDirection(std::string_view name) {
    std::string upper;
    upper.reserve(name.size());
    for (char c : name) {
        upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }

    if (upper == "N" || upper == "NORTH") return Direction::NORTH;
    if (upper == "E" || upper == "EAST")  return Direction::EAST;
    if (upper == "S" || upper == "SOUTH") return Direction::SOUTH;
    if (upper == "W" || upper == "WEST")  return Direction::WEST;
    return std::nullopt;
}

Parity parityOf(std::size_t length) {
    return length % 2 == 0 ? PARITY_EVEN : PARITY_ODD;
}
