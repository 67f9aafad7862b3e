#include "handles/image_read_handle.hpp"
#include <boost/log/trivial.hpp>

namespace imgxfer {
namespace handles {

ImageReadHandle::ImageReadHandle(std::unique_ptr<image::ImageChunkIterator> iterator)
  : iterator_(std::move(iterator)) {
  if (!iterator_) {
    throw transfer::HandleError("Image read handle: No image iterator provided");
  }
}

transfer::Chunk ImageReadHandle::read(std::size_t size) {
  if (size == 0 || !iterator_) {
    return {};
  }

  if (remainder_.empty()) {
    // Iterators may yield empty items before the end
    do {
      if (!iterator_->next(remainder_)) {
        remainder_.clear();
        return {};
      }
    } while (remainder_.empty());
    ++chunks_read_;
  }

  if (remainder_.size() <= size) {
    transfer::Chunk data = std::move(remainder_);
    remainder_.clear();
    bytes_read_ += data.size();
    return data;
  }

  transfer::Chunk data(remainder_.begin(), remainder_.begin() + size);
  remainder_.erase(remainder_.begin(), remainder_.begin() + size);
  bytes_read_ += data.size();
  return data;
}

void ImageReadHandle::update_progress() {
  BOOST_LOG_TRIVIAL(trace) << "Image read handle: Read " << bytes_read_ << " bytes in "
                           << chunks_read_ << " chunks";
}

void ImageReadHandle::close() {
  if (iterator_) {
    BOOST_LOG_TRIVIAL(debug) << "Image read handle: Closing after " << bytes_read_ << " bytes";
    iterator_.reset();
    remainder_.clear();
  }
}

} // namespace handles
} // namespace imgxfer
