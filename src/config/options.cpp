#include "config/options.hpp"
#include <filesystem>
#include <unordered_map>

namespace biowiki {
namespace config {

namespace {

enum class Flag { HOST, PORT, DIR, LOG_FILE, LOG_LEVEL };

const std::unordered_map<std::string, Flag> FLAG_MAP = {
  {"-h", Flag::HOST},
  {"--host", Flag::HOST},
  {"-p", Flag::PORT},
  {"--port", Flag::PORT},
  {"-d", Flag::DIR},
  {"--dir", Flag::DIR},
  {"-l", Flag::LOG_FILE},
  {"--log-file", Flag::LOG_FILE},
  {"-v", Flag::LOG_LEVEL},
  {"--log-level", Flag::LOG_LEVEL}
};

} // namespace

void print_usage(std::ostream& out, const std::string& program_name) {
  out << "Usage: " << program_name << " -d <dir> [options]\n"
      << "Required arguments:\n"
      << "  -d, --dir        Directory for wiki files\n"
      << "Options:\n"
      << "  -h, --host       Listen on host (default: " << DEFAULT_HOST << ")\n"
      << "  -p, --port       Listen on port (default: " << DEFAULT_PORT << ")\n"
      << "  -l, --log-file   Also write the log to this file\n"
      << "  -v, --log-level  trace, debug, info, warning, error or fatal (default: info)\n"
      << "      --help       Print this help menu\n"
      << "Example: " << program_name << " -d ./wiki -p 3000\n";
}

ProgramOptions parse_command_line(int argc, const char* const argv[], std::ostream& err) {
  ProgramOptions options;
  const std::string program_name = argc > 0 ? argv[0] : "biowiki";

  for (int i = 1; i < argc; ++i) {
    const std::string flag(argv[i]);

    if (flag == "--help") {
      options.help = true;
      options.valid = true;
      return options;
    }

    auto it = FLAG_MAP.find(flag);
    if (it == FLAG_MAP.end()) {
      err << "Error: Unknown argument: " << flag << '\n';
      print_usage(err, program_name);
      return options;
    }
    if (i + 1 >= argc) {
      err << "Error: Missing value for " << flag << '\n';
      print_usage(err, program_name);
      return options;
    }
    const std::string value(argv[++i]);

    switch (it->second) {
      case Flag::HOST:
        options.host = value;
        break;
      case Flag::PORT: {
        int port = -1;
        try {
          size_t consumed = 0;
          port = std::stoi(value, &consumed);
          if (consumed != value.size()) {
            port = -1;
          }
        } catch (const std::exception&) {
          port = -1;
        }
        if (port < 0 || port > 65535) {
          err << "Error: Invalid port number: " << value << '\n';
          print_usage(err, program_name);
          return options;
        }
        options.port = static_cast<uint16_t>(port);
        break;
      }
      case Flag::DIR:
        options.directory = value;
        break;
      case Flag::LOG_FILE:
        options.log_file = value;
        break;
      case Flag::LOG_LEVEL: {
        auto level = logging::parse_log_level(value);
        if (!level) {
          err << "Error: Invalid log level: " << value << '\n';
          print_usage(err, program_name);
          return options;
        }
        options.log_level = *level;
        break;
      }
    }
  }

  if (options.directory.empty()) {
    err << "Error: A wiki directory is required\n";
    print_usage(err, program_name);
    return options;
  }

  std::error_code ec;
  if (!std::filesystem::is_directory(options.directory, ec)) {
    err << "Error: " << options.directory << " is not a directory\n";
    return options;
  }

  options.valid = true;
  return options;
}

} // namespace config
} // namespace biowiki
