#include "Options.hpp"
#include "GeoHashTables.hpp"
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

double parseTolerance(const std::string& value) {
    const char* begin = value.c_str();
    char* end = nullptr;
    errno = 0;
    double tolerance = std::strtod(begin, &end);
    if (end == begin || *end != '\0') {
        throw std::runtime_error("value is not a valid float");
    }
    if (errno == ERANGE && std::fabs(tolerance) < 1.0 && !std::signbit(tolerance)) {
        tolerance = LAT_MAX_PRECISION;
    }
    if (!(tolerance > 0.0)) {
        throw std::runtime_error("tolerance must be positive");
    }
    return tolerance;
}

namespace {

std::string requireValue(int argc, const char* const* argv, int& i) {
    std::string flag = argv[i];
    if (i + 1 >= argc) {
        throw std::runtime_error("Option " + flag + " requires a value");
    }
    return argv[++i];
}

double flagTolerance(int argc, const char* const* argv, int& i) {
    std::string flag = argv[i];
    std::string value = requireValue(argc, argv, i);
    try {
        return parseTolerance(value);
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(flag + " '" + value + "': " + e.what());
    }
}

}

CliOptions parseOptions(int argc, const char* const* argv) {
    CliOptions options;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--tolerance") {
            options.config.latTolerance = options.config.lonTolerance = flagTolerance(argc, argv, i);
        } else if (arg == "--lat-tolerance") {
            options.config.latTolerance = flagTolerance(argc, argv, i);
        } else if (arg == "--lon-tolerance") {
            options.config.lonTolerance = flagTolerance(argc, argv, i);
        } else if (arg == "--input") {
            options.inputPath = requireValue(argc, argv, i);
        } else if (arg.rfind("--", 0) == 0) {
            throw std::runtime_error("Unknown option " + arg);
        } else {
            for (; i < argc; i++) {
                if (!options.inlineCommand.empty()) options.inlineCommand += ' ';
                options.inlineCommand += argv[i];
            }
        }
    }
    return options;
}
