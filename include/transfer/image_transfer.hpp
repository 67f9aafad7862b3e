#ifndef IMGXFER_TRANSFER_IMAGE_TRANSFER_HPP
#define IMGXFER_TRANSFER_IMAGE_TRANSFER_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include "handles/handle_factory.hpp"
#include "image/image_service.hpp"
#include "transfer/bounded_transfer_queue.hpp"
#include "transfer/copy_task.hpp"
#include "transfer/io_handle.hpp"
#include "transfer/transfer_config.hpp"
#include "transfer/transfer_session.hpp"
#include "transfer/upload_monitor.hpp"

namespace imgxfer {
namespace transfer {

// Datastore file a flat image is downloaded into
struct FlatImageDownload {
  uint64_t image_size{0};
  std::string host;
  std::string data_center_name;
  std::string datastore_name;
  handles::Cookies cookies;
  std::string file_path;
};

// Image an upload is pushed into when there is no plain write handle
struct UploadTarget {
  image::ImageService* image_service{nullptr};
  std::string image_id;
  image::ImageMetadata metadata;
};

class ImageTransfer {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit ImageTransfer(handles::HandleFactory& handle_factory, TransferConfig config = {});
  virtual ~ImageTransfer() = default;


  // ---- TRANSFER OPERATIONS ----
  // Copies an image from the image service into a datastore file
  void download_flat_image(const image::Context& context, std::chrono::seconds timeout,
                           image::ImageService& image_service, const std::string& image_id,
                           const FlatImageDownload& destination);

  // Streams read_handle into the image service through a bounded queue
  void upload_image(const image::Context& context, std::chrono::seconds timeout,
                    image::ImageService& image_service, const std::string& image_id,
                    ReadHandle& read_handle, uint64_t image_size,
                    const image::ImageMetadata& metadata = {});

  // Moves max_data_size bytes from read_handle into write_handle, or into the
  // upload target when write_handle is null. Both handles are closed on return.
  virtual void start_transfer(const image::Context& context, std::chrono::seconds timeout,
                              ReadHandle& read_handle, uint64_t max_data_size,
                              WriteHandle* write_handle, const UploadTarget* upload_target);


  // ---- GETTERS ----
  const TransferConfig& config() const { return config_; }

private:
  // ---- PARAMETERS ----
  handles::HandleFactory& handle_factory_;
  TransferConfig config_;


  // ---- TASK SUPERVISION ----
  // Waits for the copy and the optional monitor, throws on failure or deadline
  void wait_for_tasks(TransferSession& session, CopyTask& copy_task,
                      UploadMonitor* monitor, BoundedTransferQueue* queue);
  // Interrupts every task, cancels the queue and joins the workers
  void abort_tasks(CopyTask& copy_task, UploadMonitor* monitor, BoundedTransferQueue* queue);
  // Closes the handles, returns the first close error message
  std::string close_handles(ReadHandle& read_handle, WriteHandle* write_handle);
};

} // namespace transfer
} // namespace imgxfer

#endif // IMGXFER_TRANSFER_IMAGE_TRANSFER_HPP
