#ifndef IMGXFER_TRANSFER_BOUNDED_TRANSFER_QUEUE_HPP
#define IMGXFER_TRANSFER_BOUNDED_TRANSFER_QUEUE_HPP

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include "transfer/io_handle.hpp"

namespace imgxfer {
namespace transfer {

/**
 * Fixed-capacity rendezvous between one producer and one consumer of a byte
 * stream whose total length is known upfront. Writers block while the queue
 * holds max_size items; readers block while it is empty. Reads stop with an
 * empty chunk once max_transfer_size bytes have been handed out, regardless
 * of how the producer chunked its writes. A stream that is closed or
 * cancelled before that point fails the reader instead of ending cleanly.
 */
class BoundedTransferQueue : public ReadHandle, public WriteHandle {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  BoundedTransferQueue(std::size_t max_size, uint64_t max_transfer_size);
  ~BoundedTransferQueue() override = default;


  // ---- FILE-LIKE INTERFACE ----
  // Enqueues data as a single item, blocks while the queue is full
  void write(const Chunk& data) override;
  // Returns up to size bytes without crossing max_transfer_size. Throws
  // QUEUE_CLOSED after cancel() and IO_FAILURE when the producer closed the
  // stream short of max_transfer_size.
  Chunk read(std::size_t size) override;
  // Returns the declared total length of the stream, not the buffer occupancy
  uint64_t tell() const { return max_transfer_size_; }
  // Producer is done: blocked writers fail, readers drain what is queued
  void close() override;
  // Aborts the transfer: blocked writers and readers fail, queued items are dropped
  void cancel() override;


  // ---- ITEM QUEUE OPERATIONS ----
  // Blocking item exchange underneath write() and read()
  virtual void put(const Chunk& item);
  virtual Chunk get();


  // ---- QUERY METHODS ----
  uint64_t declared_total() const { return max_transfer_size_; }
  std::size_t occupancy() const;
  uint64_t transferred() const;
  bool closed() const;
  bool cancelled() const;

private:
  // ---- PARAMETERS ----
  const std::size_t max_size_;
  const uint64_t max_transfer_size_;

  mutable std::mutex mutex_;
  std::condition_variable not_full_;
  std::condition_variable not_empty_;
  std::deque<Chunk> items_;
  std::size_t buffered_bytes_{0};
  bool closed_{false};
  bool cancelled_{false};

  // Consumer side state, only touched by read()
  Chunk remainder_;
  std::atomic<uint64_t> transferred_{0};
};

} // namespace transfer
} // namespace imgxfer

#endif // IMGXFER_TRANSFER_BOUNDED_TRANSFER_QUEUE_HPP
