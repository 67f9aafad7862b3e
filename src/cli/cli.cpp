#include "cli/cli.hpp"
#include <iostream>
#include <set>
#include <boost/log/trivial.hpp>
#include "handles/file_handles.hpp"
#include "handles/handle_factory.hpp"
#include "image/local_image_service.hpp"
#include "transfer/image_transfer.hpp"
#include "transfer/transfer_error.hpp"

namespace imgxfer {
namespace cli {

namespace {

bool parse_number(const std::string& value, unsigned long max, unsigned long& result) {
  try {
    std::size_t consumed = 0;
    result = std::stoul(value, &consumed);
    return consumed == value.size() && result <= max;
  } catch (const std::exception&) {
    return false;
  }
}

bool validate(ProgramOptions& options) {
  if (options.image_dir.empty() || options.image_id.empty()) {
    std::cerr << "Error: --image-dir and --image-id are required\n";
    return false;
  }
  if (options.command == Command::DOWNLOAD &&
      (options.host.empty() || options.datacenter.empty() ||
       options.datastore.empty() || options.path.empty())) {
    std::cerr << "Error: download requires --host, --datacenter, --datastore and --path\n";
    return false;
  }
  if (options.command == Command::UPLOAD && options.file.empty()) {
    std::cerr << "Error: upload requires --file\n";
    return false;
  }
  return true;
}

int run_download(const ProgramOptions& options) {
  image::LocalImageService image_service(options.image_dir);
  image::Context context{"imgxfer-download", "", ""};
  image::ImageInfo info = image_service.show(context, options.image_id);

  handles::DefaultHandleFactory handle_factory(options.port);
  transfer::ImageTransfer image_transfer(handle_factory);

  transfer::FlatImageDownload destination;
  destination.image_size = info.size;
  destination.host = options.host;
  destination.data_center_name = options.datacenter;
  destination.datastore_name = options.datastore;
  destination.cookies = options.cookies;
  destination.file_path = options.path;

  image_transfer.download_flat_image(context, options.timeout, image_service,
                                     options.image_id, destination);
  std::cout << "Downloaded image " << options.image_id << " (" << info.size << " bytes) to ["
            << options.datastore << "] " << options.path << "\n";
  return 0;
}

int run_upload(const ProgramOptions& options) {
  image::LocalImageService image_service(options.image_dir);
  image::Context context{"imgxfer-upload", "", ""};
  if (!image_service.has_image(options.image_id)) {
    image_service.create_image(options.image_id);
  }

  handles::LocalFileReadHandle read_handle(options.file);
  handles::DefaultHandleFactory handle_factory(options.port);
  transfer::ImageTransfer image_transfer(handle_factory);

  image::ImageMetadata metadata{{"source", options.file}};
  image_transfer.upload_image(context, options.timeout, image_service, options.image_id,
                              read_handle, read_handle.file_size(), metadata);
  std::cout << "Uploaded " << read_handle.file_size() << " bytes from " << options.file
            << " to image " << options.image_id << "\n";
  return 0;
}

} // namespace

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " <download|upload> [options]\n"
            << "Common options:\n"
            << "  --image-dir <dir>     Local image catalog directory\n"
            << "  --image-id <id>       Image identifier\n"
            << "  --timeout <seconds>   Transfer timeout (default 3600)\n"
            << "  --log-file <file>     Log to file instead of the console\n"
            << "  --log-level <level>   trace, debug, info, warning, error or fatal\n"
            << "Download options:\n"
            << "  --host <host>         Datastore host\n"
            << "  --port <port>         Datastore HTTPS port (default 443)\n"
            << "  --datacenter <path>   Datacenter path\n"
            << "  --datastore <name>    Datastore name\n"
            << "  --path <file>         Destination file on the datastore\n"
            << "  --cookie <cookie>     Session cookie, may be repeated\n"
            << "Upload options:\n"
            << "  --file <file>         Local file to upload\n"
            << "Example: " << program_name
            << " upload --image-dir images --image-id disk1 --file disk1.vmdk\n";
}

ProgramOptions parse_command_line(int argc, const char* const argv[]) {
  static const std::set<std::string> known_flags = {
    "--image-dir", "--image-id", "--host", "--port", "--datacenter", "--datastore",
    "--path", "--cookie", "--file", "--timeout", "--log-file", "--log-level"
  };

  ProgramOptions options;
  const std::string program_name = argc > 0 ? argv[0] : "imgxfer";

  if (argc < 2) {
    print_usage(program_name);
    return options;
  }

  const std::string command(argv[1]);
  if (command == "download") {
    options.command = Command::DOWNLOAD;
  } else if (command == "upload") {
    options.command = Command::UPLOAD;
  } else {
    std::cerr << "Error: Unknown command: " << command << '\n';
    print_usage(program_name);
    return options;
  }

  if ((argc - 2) % 2 != 0) {
    std::cerr << "Error: Missing value for " << argv[argc - 1] << '\n';
    print_usage(program_name);
    return options;
  }

  for (int i = 2; i < argc - 1; i += 2) {
    const std::string flag(argv[i]);
    const std::string value(argv[i + 1]);

    if (known_flags.count(flag) == 0) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(program_name);
      return options;
    }

    unsigned long number = 0;
    if (flag == "--image-dir") {
      options.image_dir = value;
    } else if (flag == "--image-id") {
      options.image_id = value;
    } else if (flag == "--host") {
      options.host = value;
    } else if (flag == "--port") {
      if (!parse_number(value, 65535, number) || number == 0) {
        std::cerr << "Error: Invalid port number\n";
        return options;
      }
      options.port = static_cast<uint16_t>(number);
    } else if (flag == "--datacenter") {
      options.datacenter = value;
    } else if (flag == "--datastore") {
      options.datastore = value;
    } else if (flag == "--path") {
      options.path = value;
    } else if (flag == "--cookie") {
      options.cookies.push_back(value);
    } else if (flag == "--file") {
      options.file = value;
    } else if (flag == "--timeout") {
      if (!parse_number(value, 7 * 24 * 3600, number) || number == 0) {
        std::cerr << "Error: Invalid timeout\n";
        return options;
      }
      options.timeout = std::chrono::seconds(number);
    } else if (flag == "--log-file") {
      options.log_file = value;
    } else if (flag == "--log-level") {
      if (!logging::parse_log_level(value, options.log_level)) {
        std::cerr << "Error: Invalid log level: " << value << '\n';
        return options;
      }
    }
  }

  if (!validate(options)) {
    print_usage(program_name);
    return options;
  }

  options.valid = true;
  return options;
}

int run(const ProgramOptions& options) {
  try {
    switch (options.command) {
      case Command::DOWNLOAD: return run_download(options);
      case Command::UPLOAD: return run_upload(options);
      default: return 1;
    }
  }
  catch (const transfer::TransferError& e) {
    BOOST_LOG_TRIVIAL(error) << "CLI: Transfer failed: " << e.what();
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "CLI: " << e.what();
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
  }
}

} // namespace cli
} // namespace imgxfer
