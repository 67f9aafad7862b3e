#ifndef IMGXFER_CLI_HPP
#define IMGXFER_CLI_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include "logger/logger.hpp"

namespace imgxfer {
namespace cli {

enum class Command {
  NONE,
  DOWNLOAD,
  UPLOAD
};

struct ProgramOptions {
  Command command{Command::NONE};
  std::string image_dir;
  std::string image_id;
  // Download destination
  std::string host;
  uint16_t port{443};
  std::string datacenter;
  std::string datastore;
  std::string path;
  std::vector<std::string> cookies;
  // Upload source
  std::string file;
  std::chrono::seconds timeout{3600};
  std::string log_file;
  logging::severity_level log_level{logging::severity_level::info};
  bool valid{false};
};

void print_usage(const std::string& program_name);

// Parses "<command> --flag value ..." and reports problems on stderr
ProgramOptions parse_command_line(int argc, const char* const argv[]);

// Runs the parsed command, returns the process exit status
int run(const ProgramOptions& options);

} // namespace cli
} // namespace imgxfer

#endif // IMGXFER_CLI_HPP
