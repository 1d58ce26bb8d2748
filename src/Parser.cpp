#include "Parser.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <stdexcept>

std::pair<int, std::string_view> Parser::extractCount(std::string_view str) {
    int value = 0;
    auto res = std::from_chars(str.data(), str.data() + str.size(), value);
    if (res.ec != std::errc{} || value < 0) {
        throw std::runtime_error("Invalid count format");
    }
    std::size_t consumed = static_cast<std::size_t>(res.ptr - str.data());
    if (str.size() < consumed + 2 || str[consumed] != '\r' || str[consumed + 1] != '\n') {
        throw std::runtime_error("Missing CRLF after count");
    }
    return { value, str.substr(consumed + 2) };
}

std::pair<std::string_view, std::string_view> Parser::decodeBulkString(std::string_view msg) {
    auto [len, rem] = extractCount(msg.substr(1));
    std::size_t size = static_cast<std::size_t>(len);
    if (rem.size() < size + 2 || rem[size] != '\r' || rem[size + 1] != '\n') {
        throw std::runtime_error("Invalid bulk string format");
    }
    return { rem.substr(0, size), rem.substr(size + 2) };
}

std::vector<std::string_view> Parser::decodeArray(std::string_view msg) {
    auto [count, rem] = extractCount(msg.substr(1));
    std::vector<std::string_view> elements;
    for (int i = 0; i < count; ++i) {
        if (rem.empty() || rem[0] != '$') {
            throw std::runtime_error("Expected bulk string");
        }
        auto [bulk, next] = decodeBulkString(rem);
        elements.push_back(bulk);
        rem = next;
    }
    return elements;
}

std::vector<std::string_view> Parser::splitInline(std::string_view line) {
    std::vector<std::string_view> words;
    std::size_t pos = 0;
    while (pos < line.size()) {
        while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos]))) ++pos;
        std::size_t start = pos;
        while (pos < line.size() && !std::isspace(static_cast<unsigned char>(line[pos]))) ++pos;
        if (pos > start) words.push_back(line.substr(start, pos - start));
    }
    return words;
}

Command Parser::parse(std::string_view input) {
    std::vector<std::string_view> elements;
    if (!input.empty() && input[0] == '*') {
        elements = decodeArray(input);
    } else {
        elements = splitInline(input);
    }
    if (elements.empty()) {
        throw std::runtime_error("Empty command");
    }

    std::string name(elements[0]);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return { name, std::vector<std::string>(elements.begin() + 1, elements.end()) };
}
