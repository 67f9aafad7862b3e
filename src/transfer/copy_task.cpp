#include "transfer/copy_task.hpp"
#include <string>
#include <boost/log/trivial.hpp>
#include "transfer/transfer_error.hpp"

namespace imgxfer {
namespace transfer {

CopyTask::CopyTask(ReadHandle& input, WriteHandle& output, std::size_t chunk_size)
  : TransferTask("Copy task")
  , input_(input)
  , output_(output)
  , chunk_size_(chunk_size) {}

CopyTask::~CopyTask() {
  stop();
}

void CopyTask::run() {
  BOOST_LOG_TRIVIAL(debug) << "Copy task: Copying in chunks of " << chunk_size_ << " bytes";

  while (!stop_requested()) {
    Chunk data;
    try {
      data = input_.read(chunk_size_);
    }
    catch (const TransferError&) {
      throw;
    }
    catch (const std::exception& e) {
      if (stop_requested()) {
        throw TransferError(TransferErrorKind::CANCELLED, std::string("read cancelled: ") + e.what());
      }
      throw TransferError(TransferErrorKind::IO_FAILURE,
                          std::string("error reading from source: ") + e.what());
    }

    if (data.empty()) {
      BOOST_LOG_TRIVIAL(info) << "Copy task: End of stream after " << bytes_copied_ << " bytes";
      return;
    }

    try {
      output_.write(data);
      input_.update_progress();
      output_.update_progress();
    }
    catch (const TransferError&) {
      throw;
    }
    catch (const std::exception& e) {
      if (stop_requested()) {
        throw TransferError(TransferErrorKind::CANCELLED, std::string("write cancelled: ") + e.what());
      }
      throw TransferError(TransferErrorKind::IO_FAILURE,
                          std::string("error writing to destination: ") + e.what());
    }

    bytes_copied_ += data.size();
    BOOST_LOG_TRIVIAL(trace) << "Copy task: Copied " << data.size() << " bytes, total " << bytes_copied_;
  }

  throw TransferError(TransferErrorKind::CANCELLED,
                      "copy stopped after " + std::to_string(bytes_copied_) + " bytes");
}

void CopyTask::interrupt() {
  input_.cancel();
  output_.cancel();
}

} // namespace transfer
} // namespace imgxfer
