#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

// Thrown when a hash contains a byte outside BASE32_ALPHABET.
class InvalidCharacterError : public std::runtime_error {
public:
    InvalidCharacterError(char character, std::size_t position)
        : std::runtime_error("Hash contains illegal character '" + std::string(1, character) +
                             "' at position " + std::to_string(position)),
          badChar(character), badPosition(position) {}

    char character() const { return badChar; }
    std::size_t position() const { return badPosition; }

private:
    char badChar;
    std::size_t badPosition;
};

class InvalidDirectionError : public std::runtime_error {
public:
    explicit InvalidDirectionError(int direction)
        : std::runtime_error("Illegal input direction " + std::to_string(direction)),
          value(direction) {}

    int direction() const { return value; }

private:
    int value;
};
