#include "transfer/upload_monitor.hpp"
#include <boost/log/trivial.hpp>
#include "transfer/transfer_error.hpp"

namespace imgxfer {
namespace transfer {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

UploadMonitor::UploadMonitor(const image::Context& context, ReadHandle& input,
                             image::ImageService& image_service, const std::string& image_id,
                             const image::ImageMetadata& metadata,
                             std::chrono::milliseconds poll_interval)
  : TransferTask("Upload monitor")
  , context_(context)
  , input_(input)
  , image_service_(image_service)
  , image_id_(image_id)
  , metadata_(metadata)
  , poll_interval_(poll_interval)
  , poll_timer_(io_context_) {}

UploadMonitor::~UploadMonitor() {
  stop();
}


//==============================================
// TASK BODY
//==============================================

void UploadMonitor::run() {
  BOOST_LOG_TRIVIAL(info) << "Upload monitor: Uploading image " << image_id_;

  try {
    image_service_.update(context_, image_id_, metadata_, input_);
  }
  catch (const TransferError&) {
    throw;
  }
  catch (const std::exception& e) {
    throw TransferError(TransferErrorKind::IO_FAILURE,
                        "error uploading image " + image_id_ + ": " + e.what());
  }

  BOOST_LOG_TRIVIAL(debug) << "Upload monitor: Upload call returned, polling status of image " << image_id_;

  while (!stop_requested()) {
    if (check_status()) {
      BOOST_LOG_TRIVIAL(info) << "Upload monitor: Image " << image_id_ << " is active";
      return;
    }
    sleep_poll_interval();
  }

  throw TransferError(TransferErrorKind::CANCELLED,
                      "status polling of image " + image_id_ + " stopped");
}

void UploadMonitor::interrupt() {
  input_.cancel();
  boost::asio::post(io_context_, [this]() { poll_timer_.cancel(); });
}


//==============================================
// STATUS POLLING
//==============================================

bool UploadMonitor::check_status() {
  image::ImageInfo info;
  try {
    info = image_service_.show(context_, image_id_);
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Upload monitor: Error retrieving status of image " << image_id_
                             << ": " << e.what();
    throw TransferError(TransferErrorKind::STATUS_UNAVAILABLE,
                        "error reading status of image " + image_id_ + ": " + e.what());
  }

  BOOST_LOG_TRIVIAL(debug) << "Upload monitor: Image " << image_id_ << " status is " << info.status;

  if (info.status == image::STATUS_ACTIVE) {
    return true;
  }
  if (info.status == image::STATUS_QUEUED || info.status == image::STATUS_SAVING) {
    return false;
  }
  if (info.status == image::STATUS_KILLED) {
    throw TransferError(TransferErrorKind::IMAGE_KILLED,
                        "image " + image_id_ + " was killed by the image service");
  }
  throw TransferError(TransferErrorKind::UNKNOWN_STATUS,
                      "image " + image_id_ + " reported unexpected status '" + info.status + "'");
}

void UploadMonitor::sleep_poll_interval() {
  poll_timer_.expires_after(poll_interval_);
  poll_timer_.async_wait([](const boost::system::error_code& ec) {
    if (ec && ec != boost::asio::error::operation_aborted) {
      BOOST_LOG_TRIVIAL(warning) << "Upload monitor: Poll timer error: " << ec.message();
    }
  });

  io_context_.restart();
  io_context_.run();
}

} // namespace transfer
} // namespace imgxfer
