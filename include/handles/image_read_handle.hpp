#ifndef IMGXFER_HANDLES_IMAGE_READ_HANDLE_HPP
#define IMGXFER_HANDLES_IMAGE_READ_HANDLE_HPP

#include <cstdint>
#include <memory>
#include "image/image_service.hpp"
#include "transfer/io_handle.hpp"

namespace imgxfer {
namespace handles {

// Read handle over the byte iterator returned by ImageService::download
class ImageReadHandle : public transfer::ReadHandle {
public:
  explicit ImageReadHandle(std::unique_ptr<image::ImageChunkIterator> iterator);

  // Returns up to size bytes of the current iterator item, the rest of the
  // item is kept for the next call
  transfer::Chunk read(std::size_t size) override;
  void update_progress() override;
  void close() override;

  uint64_t bytes_read() const { return bytes_read_; }

private:
  std::unique_ptr<image::ImageChunkIterator> iterator_;
  transfer::Chunk remainder_;
  uint64_t bytes_read_{0};
  uint64_t chunks_read_{0};
};

} // namespace handles
} // namespace imgxfer

#endif // IMGXFER_HANDLES_IMAGE_READ_HANDLE_HPP
