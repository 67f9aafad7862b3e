#include "image/local_image_service.hpp"
#include <fstream>
#include <boost/log/trivial.hpp>

namespace imgxfer {
namespace image {

namespace {

constexpr const char* IMAGE_EXTENSION = ".img";

class FileChunkIterator : public ImageChunkIterator {
public:
  FileChunkIterator(const std::filesystem::path& path, std::size_t chunk_size)
    : file_(path, std::ios::binary)
    , chunk_size_(chunk_size) {
    if (!file_) {
      throw ImageServiceError("Image service: Failed to open image file: " + path.string());
    }
  }

  bool next(transfer::Chunk& chunk) override {
    if (file_.eof()) {
      return false;
    }
    chunk.resize(chunk_size_);
    file_.read(reinterpret_cast<char*>(chunk.data()), static_cast<std::streamsize>(chunk_size_));
    if (file_.bad()) {
      throw ImageServiceError("Image service: Failed to read image data");
    }
    chunk.resize(static_cast<std::size_t>(file_.gcount()));
    return !chunk.empty();
  }

private:
  std::ifstream file_;
  std::size_t chunk_size_;
};

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

LocalImageService::LocalImageService(const std::filesystem::path& root) : root_(root) {
  BOOST_LOG_TRIVIAL(info) << "Image service: Using image directory " << root_.string();
  std::filesystem::create_directories(root_);
  scan_directory();
}


//==============================================
// CATALOG MANAGEMENT
//==============================================

void LocalImageService::create_image(const std::string& image_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (images_.count(image_id) != 0) {
    throw ImageServiceError("Image service: Image already exists: " + image_id);
  }
  images_[image_id] = ImageRecord{STATUS_QUEUED, {}};
  BOOST_LOG_TRIVIAL(info) << "Image service: Created image " << image_id;
}

bool LocalImageService::has_image(const std::string& image_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return images_.count(image_id) != 0;
}

std::filesystem::path LocalImageService::image_path(const std::string& image_id) const {
  return root_ / (image_id + IMAGE_EXTENSION);
}

ImageMetadata LocalImageService::metadata(const std::string& image_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = images_.find(image_id);
  if (it == images_.end()) {
    throw ImageServiceError("Image service: Image not found: " + image_id);
  }
  return it->second.metadata;
}


//==============================================
// IMAGE SERVICE INTERFACE
//==============================================

std::unique_ptr<ImageChunkIterator> LocalImageService::download(const Context& context,
                                                                const std::string& image_id) {
  BOOST_LOG_TRIVIAL(info) << "Image service: Request " << context.request_id
                          << " downloading image " << image_id;

  ImageInfo info = show(context, image_id);
  if (info.status != STATUS_ACTIVE) {
    throw ImageServiceError("Image service: Image " + image_id + " is not active (" + info.status + ")");
  }
  return std::make_unique<FileChunkIterator>(image_path(image_id), DOWNLOAD_CHUNK_SIZE);
}

void LocalImageService::update(const Context& context, const std::string& image_id,
                               const ImageMetadata& metadata, transfer::ReadHandle& data) {
  BOOST_LOG_TRIVIAL(info) << "Image service: Request " << context.request_id
                          << " updating image " << image_id;

  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = images_.find(image_id);
    if (it == images_.end()) {
      throw ImageServiceError("Image service: Image not found: " + image_id);
    }
    it->second.status = STATUS_SAVING;
    it->second.metadata = metadata;
  }

  uint64_t total_bytes = 0;
  try {
    std::ofstream file(image_path(image_id), std::ios::binary | std::ios::trunc);
    if (!file) {
      throw ImageServiceError("Image service: Failed to create image file for " + image_id);
    }

    while (true) {
      transfer::Chunk chunk = data.read(DOWNLOAD_CHUNK_SIZE);
      if (chunk.empty()) {
        break;
      }
      file.write(reinterpret_cast<const char*>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
      if (!file) {
        throw ImageServiceError("Image service: Failed to write image data for " + image_id);
      }
      total_bytes += chunk.size();
    }
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Image service: Upload of image " << image_id << " failed: " << e.what();
    set_status(image_id, STATUS_KILLED);
    throw ImageServiceError(std::string("Image service: Upload failed: ") + e.what());
  }

  set_status(image_id, STATUS_ACTIVE);
  BOOST_LOG_TRIVIAL(info) << "Image service: Stored " << total_bytes << " bytes for image " << image_id;
}

ImageInfo LocalImageService::show(const Context& /*context*/, const std::string& image_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = images_.find(image_id);
  if (it == images_.end()) {
    throw ImageServiceError("Image service: Image not found: " + image_id);
  }

  ImageInfo info;
  info.status = it->second.status;
  std::error_code ec;
  auto size = std::filesystem::file_size(image_path(image_id), ec);
  info.size = ec ? 0 : size;
  return info;
}


//==============================================
// CATALOG SUPPORT
//==============================================

void LocalImageService::scan_directory() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& entry : std::filesystem::directory_iterator(root_)) {
    if (entry.is_regular_file() && entry.path().extension() == IMAGE_EXTENSION) {
      images_[entry.path().stem().string()] = ImageRecord{STATUS_ACTIVE, {}};
    }
  }
  BOOST_LOG_TRIVIAL(debug) << "Image service: Found " << images_.size() << " existing images";
}

void LocalImageService::set_status(const std::string& image_id, const std::string& status) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = images_.find(image_id);
  if (it != images_.end()) {
    it->second.status = status;
  }
}

} // namespace image
} // namespace imgxfer
