#include "handles/handle_factory.hpp"
#include <boost/log/trivial.hpp>
#include "handles/datastore_write_handle.hpp"
#include "handles/image_read_handle.hpp"

namespace imgxfer {
namespace handles {

std::unique_ptr<transfer::ReadHandle> DefaultHandleFactory::create_image_read_handle(
  std::unique_ptr<image::ImageChunkIterator> iterator) {
  return std::make_unique<ImageReadHandle>(std::move(iterator));
}

std::unique_ptr<transfer::WriteHandle> DefaultHandleFactory::create_file_write_handle(
  const std::string& host, const std::string& data_center_name,
  const std::string& datastore_name, const Cookies& cookies,
  const std::string& file_path, uint64_t file_size) {
  BOOST_LOG_TRIVIAL(debug) << "Handle factory: Creating datastore write handle for " << file_path;
  return std::make_unique<DatastoreWriteHandle>(host, data_center_name, datastore_name,
                                                cookies, file_path, file_size, port_);
}

} // namespace handles
} // namespace imgxfer
