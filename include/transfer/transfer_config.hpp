#ifndef IMGXFER_TRANSFER_TRANSFER_CONFIG_HPP
#define IMGXFER_TRANSFER_TRANSFER_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include "transfer/io_handle.hpp"
#include "transfer/upload_monitor.hpp"

namespace imgxfer {
namespace transfer {

struct TransferConfig {
  // Bytes requested by every copy loop read
  std::size_t chunk_size = READ_CHUNK_SIZE;
  // Items buffered between producer and image service on upload
  std::size_t queue_capacity = 10;
  // Delay between image status polls
  std::chrono::milliseconds poll_interval = UploadMonitor::DEFAULT_POLL_INTERVAL;
};

} // namespace transfer
} // namespace imgxfer

#endif // IMGXFER_TRANSFER_TRANSFER_CONFIG_HPP
