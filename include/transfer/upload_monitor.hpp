#ifndef IMGXFER_TRANSFER_UPLOAD_MONITOR_HPP
#define IMGXFER_TRANSFER_UPLOAD_MONITOR_HPP

#include <chrono>
#include <string>
#include <boost/asio.hpp>
#include "image/image_service.hpp"
#include "transfer/io_handle.hpp"
#include "transfer/transfer_task.hpp"

namespace imgxfer {
namespace transfer {

/**
 * Uploads a byte stream into the image service and then polls the image
 * status until the service finishes processing it. The upload call always
 * happens before the first poll. Only "active" counts as success; "queued"
 * and "saving" keep the poll going and every other status is a failure.
 */
class UploadMonitor : public TransferTask {
public:
  static constexpr std::chrono::milliseconds DEFAULT_POLL_INTERVAL{5000};

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  UploadMonitor(const image::Context& context, ReadHandle& input,
                image::ImageService& image_service, const std::string& image_id,
                const image::ImageMetadata& metadata = {},
                std::chrono::milliseconds poll_interval = DEFAULT_POLL_INTERVAL);
  ~UploadMonitor() override;

protected:
  void run() override;
  // Cancels the input and a pending poll sleep
  void interrupt() override;

private:
  // ---- PARAMETERS ----
  image::Context context_;
  ReadHandle& input_;
  image::ImageService& image_service_;
  std::string image_id_;
  image::ImageMetadata metadata_;
  std::chrono::milliseconds poll_interval_;

  // Poll timer, driven by the worker thread
  boost::asio::io_context io_context_;
  boost::asio::steady_timer poll_timer_;


  // ---- STATUS POLLING ----
  // Returns true once the image is active, throws on any failure status
  bool check_status();
  // Sleeps for one poll interval unless interrupted
  void sleep_poll_interval();
};

} // namespace transfer
} // namespace imgxfer

#endif // IMGXFER_TRANSFER_UPLOAD_MONITOR_HPP
