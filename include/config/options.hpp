#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include "logger/logger.hpp"

namespace biowiki {
namespace config {

constexpr const char* DEFAULT_HOST = "127.0.0.1";
constexpr uint16_t DEFAULT_PORT = 3000;

struct ProgramOptions {
  std::string host{DEFAULT_HOST};
  uint16_t port{DEFAULT_PORT};
  std::string directory;
  std::string log_file;
  logging::severity_level log_level{logging::severity_level::info};
  bool help{false};
  bool valid{false};
};

void print_usage(std::ostream& out, const std::string& program_name);

// Parses "-x value" pairs. Errors are reported on err together with the
// usage text and leave valid == false. --help sets help and valid.
ProgramOptions parse_command_line(int argc, const char* const argv[], std::ostream& err);

} // namespace config
} // namespace biowiki
