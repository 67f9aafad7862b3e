#ifndef IMGXFER_HANDLES_HANDLE_FACTORY_HPP
#define IMGXFER_HANDLES_HANDLE_FACTORY_HPP

#include <cstdint>
#include <memory>
#include <string>
#include "handles/datastore_write_handle.hpp"
#include "image/image_service.hpp"
#include "transfer/io_handle.hpp"

namespace imgxfer {
namespace handles {

// Builds the concrete handles used by the transfer paths
class HandleFactory {
public:
  virtual ~HandleFactory() = default;

  // Wraps an image service byte iterator as a read handle
  virtual std::unique_ptr<transfer::ReadHandle> create_image_read_handle(
    std::unique_ptr<image::ImageChunkIterator> iterator) = 0;

  // Opens a write handle on a datastore file
  virtual std::unique_ptr<transfer::WriteHandle> create_file_write_handle(
    const std::string& host, const std::string& data_center_name,
    const std::string& datastore_name, const Cookies& cookies,
    const std::string& file_path, uint64_t file_size) = 0;
};

// Produces ImageReadHandle and DatastoreWriteHandle instances
class DefaultHandleFactory : public HandleFactory {
public:
  explicit DefaultHandleFactory(uint16_t port = 443) : port_(port) {}

  std::unique_ptr<transfer::ReadHandle> create_image_read_handle(
    std::unique_ptr<image::ImageChunkIterator> iterator) override;

  std::unique_ptr<transfer::WriteHandle> create_file_write_handle(
    const std::string& host, const std::string& data_center_name,
    const std::string& datastore_name, const Cookies& cookies,
    const std::string& file_path, uint64_t file_size) override;

private:
  uint16_t port_;
};

} // namespace handles
} // namespace imgxfer

#endif // IMGXFER_HANDLES_HANDLE_FACTORY_HPP
