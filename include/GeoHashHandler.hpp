#pragma once
#include "GeoHash.hpp"
#include <ostream>
#include <string>
#include <vector>

struct HandlerConfig {
    double latTolerance = 0.001;
    double lonTolerance = 0.001;
};

class GeoHashHandler {
public:
    GeoHashHandler(std::ostream& out, const HandlerConfig& config = HandlerConfig());

    void handleMessage(const std::string& message);
    bool isGeoHashCommand(const std::string& cmd);
    void handleCommand(const std::string& cmd, const std::vector<std::string>& args);
    void sendResponse(const std::string& response);

private:
    std::ostream& out;
    HandlerConfig config;

    void handlePing(const std::vector<std::string>& args);
    void handleEncode(const std::vector<std::string>& args);
    void handleDecode(const std::vector<std::string>& args);
    void handleNeighbor(const std::vector<std::string>& args);
    void handleNeighbors(const std::vector<std::string>& args);
    void handleValidate(const std::vector<std::string>& args);
};
