#include <iostream>
#include <fstream>
#include <string>
#include <stdexcept>
#include "GeoHashHandler.hpp"
#include "Options.hpp"

void handleSession(std::istream& in, GeoHashHandler& handler) {
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.find_first_not_of(" \t") == std::string::npos) continue;
    handler.handleMessage(line);
  }
}

int main(int argc, char **argv) {
  std::cout << std::unitbuf;
  std::cerr << std::unitbuf;

  CliOptions options;
  try {
    options = parseOptions(argc, argv);
  } catch (const std::runtime_error& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  GeoHashHandler handler(std::cout, options.config);

  if (!options.inlineCommand.empty()) {
    handler.handleMessage(options.inlineCommand);
    return 0;
  }

  if (!options.inputPath.empty()) {
    std::ifstream file(options.inputPath);
    if (!file.is_open()) {
      std::cerr << "Failed to open input file " << options.inputPath << "\n";
      return 1;
    }
    handleSession(file, handler);
    return 0;
  }

  handleSession(std::cin, handler);
  return 0;
}
