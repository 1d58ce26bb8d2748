#pragma once
#include "GeoHashHandler.hpp"
#include <string>

struct CliOptions {
    HandlerConfig config;
    std::string inputPath;
    std::string inlineCommand;
};

// Underflow to zero is raised to the precision floor; zero, negative and
// non-numeric values throw std::runtime_error.
double parseTolerance(const std::string& value);

// Everything after the first non-flag argument is joined into inlineCommand.
CliOptions parseOptions(int argc, const char* const* argv);
