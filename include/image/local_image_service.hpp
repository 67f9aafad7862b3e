#ifndef IMGXFER_IMAGE_LOCAL_IMAGE_SERVICE_HPP
#define IMGXFER_IMAGE_LOCAL_IMAGE_SERVICE_HPP

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include "image/image_service.hpp"

namespace imgxfer {
namespace image {

/**
 * Image catalog kept in a local directory, one "<image_id>.img" file per
 * image. Status moves queued -> saving -> active while an upload is drained,
 * or to killed when the upload fails.
 */
class LocalImageService : public ImageService {
public:
  static constexpr std::size_t DOWNLOAD_CHUNK_SIZE = 64 * 1024;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit LocalImageService(const std::filesystem::path& root);


  // ---- CATALOG MANAGEMENT ----
  // Registers a new image in the queued state
  void create_image(const std::string& image_id);
  bool has_image(const std::string& image_id) const;
  std::filesystem::path image_path(const std::string& image_id) const;


  // ---- IMAGE SERVICE INTERFACE ----
  std::unique_ptr<ImageChunkIterator> download(const Context& context,
                                               const std::string& image_id) override;
  void update(const Context& context, const std::string& image_id,
              const ImageMetadata& metadata, transfer::ReadHandle& data) override;
  ImageInfo show(const Context& context, const std::string& image_id) override;

  // Metadata recorded by the last update of the image
  ImageMetadata metadata(const std::string& image_id) const;

private:
  struct ImageRecord {
    std::string status;
    ImageMetadata metadata;
  };

  // ---- PARAMETERS ----
  std::filesystem::path root_;
  mutable std::mutex mutex_;
  std::map<std::string, ImageRecord> images_;


  // ---- CATALOG SUPPORT ----
  // Picks up images already present in the directory as active
  void scan_directory();
  void set_status(const std::string& image_id, const std::string& status);
};

} // namespace image
} // namespace imgxfer

#endif // IMGXFER_IMAGE_LOCAL_IMAGE_SERVICE_HPP
