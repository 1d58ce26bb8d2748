#include "GeoHashHandler.hpp"
#include "Parser.hpp"
#include "Options.hpp"
#include <sstream>
#include <iomanip>
#include <stdexcept>

namespace {

std::string bulkString(const std::string& value) {
    return "$" + std::to_string(value.size()) + "\r\n" + value + "\r\n";
}

std::string formatDouble(double value) {
    std::ostringstream ss;
    ss << std::setprecision(17) << value;
    return ss.str();
}

}

GeoHashHandler::GeoHashHandler(std::ostream& out, const HandlerConfig& config)
    : out(out), config(config) {}

void GeoHashHandler::handleMessage(const std::string& message) {
    Parser parser;
    try {
        Command cmd = parser.parse(message);
        if (isGeoHashCommand(cmd.name)) {
            handleCommand(cmd.name, cmd.args);
        } else {
            sendResponse("-ERR unknown command '" + cmd.name + "'\r\n");
        }
    } catch (const std::runtime_error& e) {
        sendResponse("-ERR " + std::string(e.what()) + "\r\n");
    }
}

bool GeoHashHandler::isGeoHashCommand(const std::string& cmd) {
    return cmd == "PING" || cmd == "ENCODE" || cmd == "DECODE" ||
        cmd == "NEIGHBOR" || cmd == "NEIGHBORS" || cmd == "VALIDATE";
}

void GeoHashHandler::handleCommand(const std::string& cmd, const std::vector<std::string>& args) {
    try {
        if (cmd == "PING") handlePing(args);
        else if (cmd == "ENCODE") handleEncode(args);
        else if (cmd == "DECODE") handleDecode(args);
        else if (cmd == "NEIGHBOR") handleNeighbor(args);
        else if (cmd == "NEIGHBORS") handleNeighbors(args);
        else if (cmd == "VALIDATE") handleValidate(args);
        else sendResponse("-ERR Unsupported geohash command\r\n");
    } catch (const std::invalid_argument&) {
        sendResponse("-ERR value is not a valid float\r\n");
    } catch (const std::out_of_range&) {
        sendResponse("-ERR value is out of range\r\n");
    }
}

void GeoHashHandler::sendResponse(const std::string& response) {
    out << response;
    out.flush();
}

void GeoHashHandler::handlePing(const std::vector<std::string>& args) {
    if (args.empty()) sendResponse("+PONG\r\n");
    else sendResponse(bulkString(args[0]));
}

void GeoHashHandler::handleEncode(const std::vector<std::string>& args) {
    if (args.size() < 2 || args.size() > 4) {
        sendResponse("-ERR ENCODE requires latitude, longitude and optional tolerances\r\n");
        return;
    }

    double latitude = std::stod(args[0]);
    double longitude = std::stod(args[1]);
    double latTolerance = config.latTolerance;
    double lonTolerance = config.lonTolerance;

    if (args.size() == 3) {
        latTolerance = lonTolerance = parseTolerance(args[2]);
    } else if (args.size() == 4) {
        latTolerance = parseTolerance(args[2]);
        lonTolerance = parseTolerance(args[3]);
    }

    GeoHash gh = GeoHash::encode(latitude, longitude, latTolerance, lonTolerance);
    sendResponse(bulkString(gh.str()));
}

void GeoHashHandler::handleDecode(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        sendResponse("-ERR DECODE requires a hash\r\n");
        return;
    }

    BoundingBox box = GeoHash::parse(args[0]).decode();

    std::ostringstream resp;
    resp << "*4\r\n";
    resp << bulkString(formatDouble(box.latMin));
    resp << bulkString(formatDouble(box.latDelta));
    resp << bulkString(formatDouble(box.lonMin));
    resp << bulkString(formatDouble(box.lonDelta));
    sendResponse(resp.str());
}

void GeoHashHandler::handleNeighbor(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        sendResponse("-ERR NEIGHBOR requires a hash and a direction\r\n");
        return;
    }

    auto dir = parseDirection(args[1]);
    if (!dir.has_value()) {
        sendResponse("-ERR unknown direction '" + args[1] + "'\r\n");
        return;
    }

    GeoHash result = GeoHash::neighbor(args[0], dir.value());
    sendResponse(bulkString(result.str()));
}

void GeoHashHandler::handleNeighbors(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        sendResponse("-ERR NEIGHBORS requires a hash\r\n");
        return;
    }

    GeoHash gh = GeoHash::parse(args[0]);

    std::ostringstream resp;
    resp << "*" << DIRECTION_COUNT << "\r\n";
    for (Direction dir : {Direction::NORTH, Direction::EAST, Direction::SOUTH, Direction::WEST}) {
        resp << bulkString(gh.neighbor(dir).str());
    }
    sendResponse(resp.str());
}

void GeoHashHandler::handleValidate(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        sendResponse("-ERR VALIDATE requires a hash\r\n");
        return;
    }
    sendResponse(GeoHash::tryParse(args[0]).has_value() ? ":1\r\n" : ":0\r\n");
}
