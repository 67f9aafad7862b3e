#include "transfer/bounded_transfer_queue.hpp"
#include <algorithm>
#include <string>
#include <boost/log/trivial.hpp>
#include "transfer/transfer_error.hpp"

namespace imgxfer {
namespace transfer {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

BoundedTransferQueue::BoundedTransferQueue(std::size_t max_size, uint64_t max_transfer_size)
  : max_size_(max_size == 0 ? 1 : max_size)
  , max_transfer_size_(max_transfer_size) {
  BOOST_LOG_TRIVIAL(debug) << "Transfer queue: Created with capacity " << max_size_
                           << " items for " << max_transfer_size_ << " bytes";
}


//==============================================
// FILE-LIKE INTERFACE
//==============================================

void BoundedTransferQueue::write(const Chunk& data) {
  // An empty item would read back as end-of-stream
  if (data.empty()) {
    return;
  }
  put(data);
}

Chunk BoundedTransferQueue::read(std::size_t size) {
  if (cancelled()) {
    throw TransferError(TransferErrorKind::QUEUE_CLOSED,
                        "transfer aborted after " + std::to_string(transferred_.load()) + " bytes");
  }
  if (size == 0) {
    return {};
  }

  uint64_t transferred = transferred_.load();
  if (transferred >= max_transfer_size_) {
    BOOST_LOG_TRIVIAL(trace) << "Transfer queue: Declared size of " << max_transfer_size_ << " bytes reached";
    return {};
  }

  if (remainder_.empty()) {
    remainder_ = get();
    if (remainder_.empty()) {
      if (cancelled()) {
        throw TransferError(TransferErrorKind::QUEUE_CLOSED,
                            "transfer aborted after " + std::to_string(transferred) + " bytes");
      }
      BOOST_LOG_TRIVIAL(error) << "Transfer queue: Stream closed after " << transferred << " of "
                               << max_transfer_size_ << " bytes";
      throw TransferError(TransferErrorKind::IO_FAILURE,
                          "source ended after " + std::to_string(transferred) + " of " +
                          std::to_string(max_transfer_size_) + " bytes");
    }
  }

  uint64_t allowed = std::min<uint64_t>(size, max_transfer_size_ - transferred);
  std::size_t count = static_cast<std::size_t>(std::min<uint64_t>(remainder_.size(), allowed));

  Chunk data(remainder_.begin(), remainder_.begin() + count);
  remainder_.erase(remainder_.begin(), remainder_.begin() + count);
  transferred_ += count;
  return data;
}

void BoundedTransferQueue::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return;
    }
    closed_ = true;
  }
  not_full_.notify_all();
  not_empty_.notify_all();
  BOOST_LOG_TRIVIAL(debug) << "Transfer queue: Closed";
}

void BoundedTransferQueue::cancel() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_) {
      return;
    }
    cancelled_ = true;
    closed_ = true;
    items_.clear();
    buffered_bytes_ = 0;
  }
  not_full_.notify_all();
  not_empty_.notify_all();
  BOOST_LOG_TRIVIAL(debug) << "Transfer queue: Cancelled after " << transferred_.load() << " bytes";
}


//==============================================
// ITEM QUEUE OPERATIONS
//==============================================

void BoundedTransferQueue::put(const Chunk& item) {
  std::unique_lock<std::mutex> lock(mutex_);
  not_full_.wait(lock, [this] { return closed_ || items_.size() < max_size_; });

  if (closed_) {
    throw TransferError(TransferErrorKind::QUEUE_CLOSED, "cannot write to a closed transfer queue");
  }

  items_.push_back(item);
  buffered_bytes_ += item.size();
  lock.unlock();
  not_empty_.notify_one();
}

Chunk BoundedTransferQueue::get() {
  std::unique_lock<std::mutex> lock(mutex_);
  not_empty_.wait(lock, [this] { return closed_ || !items_.empty(); });

  if (items_.empty()) {
    return {};
  }

  Chunk item = std::move(items_.front());
  items_.pop_front();
  buffered_bytes_ -= item.size();
  lock.unlock();
  not_full_.notify_one();
  return item;
}


//==============================================
// QUERY METHODS
//==============================================

std::size_t BoundedTransferQueue::occupancy() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return buffered_bytes_;
}

uint64_t BoundedTransferQueue::transferred() const {
  return transferred_.load();
}

bool BoundedTransferQueue::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

bool BoundedTransferQueue::cancelled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cancelled_;
}

} // namespace transfer
} // namespace imgxfer
