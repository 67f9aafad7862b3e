#include "transfer/image_transfer.hpp"
#include <algorithm>
#include <memory>
#include <boost/log/trivial.hpp>
#include "transfer/transfer_error.hpp"

namespace imgxfer {
namespace transfer {

namespace {

// Longest single block while supervising tasks, bounds how late a failure of
// the other task is noticed
constexpr std::chrono::milliseconds TASK_WAIT_SLICE{50};

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ImageTransfer::ImageTransfer(handles::HandleFactory& handle_factory, TransferConfig config)
  : handle_factory_(handle_factory)
  , config_(config) {}


//==============================================
// TRANSFER OPERATIONS
//==============================================

void ImageTransfer::download_flat_image(const image::Context& context, std::chrono::seconds timeout,
                                        image::ImageService& image_service, const std::string& image_id,
                                        const FlatImageDownload& destination) {
  BOOST_LOG_TRIVIAL(info) << "Image transfer: Downloading image " << image_id << " to ["
                          << destination.datastore_name << "] " << destination.file_path
                          << " on host " << destination.host;

  std::unique_ptr<ReadHandle> read_handle;
  std::unique_ptr<WriteHandle> write_handle;
  try {
    auto image_iterator = image_service.download(context, image_id);
    read_handle = handle_factory_.create_image_read_handle(std::move(image_iterator));
    write_handle = handle_factory_.create_file_write_handle(
      destination.host, destination.data_center_name, destination.datastore_name,
      destination.cookies, destination.file_path, destination.image_size);
  }
  catch (const TransferError&) {
    throw;
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Image transfer: Failed to open handles for image " << image_id
                             << ": " << e.what();
    if (read_handle) {
      close_handles(*read_handle, nullptr);
    }
    throw TransferError(TransferErrorKind::IO_FAILURE,
                        "cannot open transfer of image " + image_id + ": " + e.what());
  }

  start_transfer(context, timeout, *read_handle, destination.image_size, write_handle.get(), nullptr);
  BOOST_LOG_TRIVIAL(info) << "Image transfer: Downloaded image " << image_id << " to "
                          << destination.file_path;
}

void ImageTransfer::upload_image(const image::Context& context, std::chrono::seconds timeout,
                                 image::ImageService& image_service, const std::string& image_id,
                                 ReadHandle& read_handle, uint64_t image_size,
                                 const image::ImageMetadata& metadata) {
  BOOST_LOG_TRIVIAL(info) << "Image transfer: Uploading " << image_size << " bytes to image " << image_id;

  UploadTarget target{&image_service, image_id, metadata};
  start_transfer(context, timeout, read_handle, image_size, nullptr, &target);
  BOOST_LOG_TRIVIAL(info) << "Image transfer: Uploaded image " << image_id;
}

void ImageTransfer::start_transfer(const image::Context& context, std::chrono::seconds timeout,
                                   ReadHandle& read_handle, uint64_t max_data_size,
                                   WriteHandle* write_handle, const UploadTarget* upload_target) {
  if (!write_handle && (!upload_target || !upload_target->image_service)) {
    close_handles(read_handle, nullptr);
    throw TransferError(TransferErrorKind::IO_FAILURE, "transfer has neither a write handle nor an image service");
  }

  TransferSession session(max_data_size, timeout);
  std::unique_ptr<BoundedTransferQueue> queue;
  std::unique_ptr<CopyTask> copy_task;
  std::unique_ptr<UploadMonitor> monitor;

  if (write_handle) {
    copy_task = std::make_unique<CopyTask>(read_handle, *write_handle, config_.chunk_size);
  } else {
    // The image service pulls from the queue while the copy task fills it
    queue = std::make_unique<BoundedTransferQueue>(config_.queue_capacity, max_data_size);
    copy_task = std::make_unique<CopyTask>(read_handle, *queue, config_.chunk_size);
    monitor = std::make_unique<UploadMonitor>(context, *queue, *upload_target->image_service,
                                              upload_target->image_id, upload_target->metadata,
                                              config_.poll_interval);
  }

  BOOST_LOG_TRIVIAL(debug) << "Image transfer: Starting transfer of " << max_data_size
                           << " bytes with a timeout of " << timeout.count() << "s";

  try {
    if (monitor) {
      monitor->start();
    }
    copy_task->start();
    wait_for_tasks(session, *copy_task, monitor.get(), queue.get());
    session.outcome = TransferOutcome::SUCCEEDED;
  }
  catch (const TransferError& e) {
    session.outcome = e.kind() == TransferErrorKind::TIMEOUT ? TransferOutcome::TIMED_OUT
                                                            : TransferOutcome::FAILED;
    BOOST_LOG_TRIVIAL(error) << "Image transfer: Transfer " << transfer_outcome_to_string(session.outcome)
                             << ": " << e.what();
    abort_tasks(*copy_task, monitor.get(), queue.get());
    session.bytes_transferred = copy_task->bytes_copied();
    close_handles(read_handle, write_handle);
    throw;
  }

  session.bytes_transferred = copy_task->bytes_copied();
  std::string close_error = close_handles(read_handle, write_handle);
  if (!close_error.empty()) {
    session.outcome = TransferOutcome::FAILED;
    throw TransferError(TransferErrorKind::IO_FAILURE, close_error);
  }

  BOOST_LOG_TRIVIAL(info) << "Image transfer: Transferred " << session.bytes_transferred << " of "
                          << session.total_size << " bytes in " << session.elapsed_seconds() << "s";
}


//==============================================
// TASK SUPERVISION
//==============================================

void ImageTransfer::wait_for_tasks(TransferSession& session, CopyTask& copy_task,
                                   UploadMonitor* monitor, BoundedTransferQueue* queue) {
  bool copy_done = false;
  bool monitor_done = monitor == nullptr;

  while (!copy_done || !monitor_done) {
    auto now = TransferSession::Clock::now();
    if (now >= session.deadline) {
      throw TransferError(TransferErrorKind::TIMEOUT,
                          "transfer did not complete within " +
                          std::to_string(std::chrono::duration_cast<std::chrono::seconds>(
                            session.deadline - session.started).count()) + "s");
    }

    // Only the first pending task is waited on, the other is just checked
    auto slice_end = std::min(session.deadline, now + TASK_WAIT_SLICE);

    if (!copy_done && copy_task.wait_until(slice_end)) {
      copy_done = true;
      try {
        copy_task.wait();
      }
      catch (const TransferError& e) {
        if (!monitor_done || e.kind() != TransferErrorKind::QUEUE_CLOSED) {
          throw;
        }
        BOOST_LOG_TRIVIAL(warning) << "Image transfer: Source held more than the declared "
                                   << session.total_size << " bytes, surplus discarded";
      }
      // Only a producer that finished cleanly ends the stream, a failed one
      // cancels it in abort_tasks
      if (queue) {
        queue->close();
      }
    }

    if (!monitor_done && monitor->wait_until(copy_done ? slice_end : now)) {
      monitor_done = true;
      monitor->wait();
      if (!copy_done && queue) {
        queue->close();
      }
    }
  }
}

void ImageTransfer::abort_tasks(CopyTask& copy_task, UploadMonitor* monitor, BoundedTransferQueue* queue) {
  copy_task.request_stop();
  if (monitor) {
    monitor->request_stop();
  }
  if (queue) {
    queue->cancel();
  }

  copy_task.stop();
  if (monitor) {
    monitor->stop();
  }
  BOOST_LOG_TRIVIAL(debug) << "Image transfer: All transfer tasks stopped";
}

std::string ImageTransfer::close_handles(ReadHandle& read_handle, WriteHandle* write_handle) {
  std::string first_error;

  try {
    read_handle.close();
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Image transfer: Error closing read handle: " << e.what();
    first_error = std::string("error closing read handle: ") + e.what();
  }

  if (write_handle) {
    try {
      write_handle->close();
    }
    catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Image transfer: Error closing write handle: " << e.what();
      if (first_error.empty()) {
        first_error = std::string("error closing write handle: ") + e.what();
      }
    }
  }

  return first_error;
}

} // namespace transfer
} // namespace imgxfer
