#include <iostream>
#include "cli/cli.hpp"
#include "logger/logger.hpp"

int main(int argc, char* argv[]) {
  const auto options = imgxfer::cli::parse_command_line(argc, argv);
  if (!options.valid) {
    return 1;
  }

  try {
    imgxfer::logging::init_logging(options.log_file, options.log_level);
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to initialize logging: " << e.what() << '\n';
    return 1;
  }

  return imgxfer::cli::run(options);
}
