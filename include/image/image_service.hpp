#ifndef IMGXFER_IMAGE_IMAGE_SERVICE_HPP
#define IMGXFER_IMAGE_IMAGE_SERVICE_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include "transfer/io_handle.hpp"

namespace imgxfer {
namespace image {

// Image status values reported by the image service
inline constexpr const char* STATUS_QUEUED = "queued";
inline constexpr const char* STATUS_SAVING = "saving";
inline constexpr const char* STATUS_ACTIVE = "active";
inline constexpr const char* STATUS_KILLED = "killed";

// Caller identity passed through to every image service call
struct Context {
  std::string request_id;
  std::string auth_token;
  std::string project_id;
};

inline bool operator==(const Context& lhs, const Context& rhs) {
  return lhs.request_id == rhs.request_id &&
         lhs.auth_token == rhs.auth_token &&
         lhs.project_id == rhs.project_id;
}

struct ImageInfo {
  std::string status;
  uint64_t size{0};
};

using ImageMetadata = std::map<std::string, std::string>;

// Pull-based source of image bytes, one item per call
class ImageChunkIterator {
public:
  virtual ~ImageChunkIterator() = default;

  // Fills chunk with the next item, returns false once the image is exhausted
  virtual bool next(transfer::Chunk& chunk) = 0;
};

class ImageService {
public:
  virtual ~ImageService() = default;

  virtual std::unique_ptr<ImageChunkIterator> download(const Context& context,
                                                       const std::string& image_id) = 0;
  // Uploads the image bytes, reading data until it reports end-of-stream
  virtual void update(const Context& context, const std::string& image_id,
                      const ImageMetadata& metadata, transfer::ReadHandle& data) = 0;
  virtual ImageInfo show(const Context& context, const std::string& image_id) = 0;
};

class ImageServiceError : public std::runtime_error {
public:
  explicit ImageServiceError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace image
} // namespace imgxfer

#endif // IMGXFER_IMAGE_IMAGE_SERVICE_HPP
