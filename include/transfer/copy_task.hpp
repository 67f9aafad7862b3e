#ifndef IMGXFER_TRANSFER_COPY_TASK_HPP
#define IMGXFER_TRANSFER_COPY_TASK_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include "transfer/io_handle.hpp"
#include "transfer/transfer_task.hpp"

namespace imgxfer {
namespace transfer {

// Pumps fixed-size chunks from a read handle into a write handle until end-of-stream
class CopyTask : public TransferTask {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  CopyTask(ReadHandle& input, WriteHandle& output, std::size_t chunk_size = READ_CHUNK_SIZE);
  ~CopyTask() override;


  // ---- GETTERS ----
  uint64_t bytes_copied() const { return bytes_copied_; }

protected:
  void run() override;
  // Cancels both handles so a blocked read or write returns
  void interrupt() override;

private:
  // ---- PARAMETERS ----
  ReadHandle& input_;
  WriteHandle& output_;
  std::size_t chunk_size_;
  std::atomic<uint64_t> bytes_copied_{0};
};

} // namespace transfer
} // namespace imgxfer

#endif // IMGXFER_TRANSFER_COPY_TASK_HPP
