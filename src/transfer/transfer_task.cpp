#include "transfer/transfer_task.hpp"
#include <system_error>
#include <boost/log/trivial.hpp>
#include "transfer/transfer_error.hpp"

namespace imgxfer {
namespace transfer {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TransferTask::TransferTask(std::string name)
  : name_(std::move(name))
  , result_(done_.get_future().share()) {}

// Derived classes stop() in their own destructors so interrupt() still dispatches
TransferTask::~TransferTask() {
  stop_requested_ = true;
  join_worker();
}


//==============================================
// TASK CONTROL
//==============================================

void TransferTask::start() {
  if (started_.exchange(true)) {
    BOOST_LOG_TRIVIAL(debug) << name_ << ": Task already started";
    return;
  }

  std::lock_guard<std::mutex> lock(worker_mutex_);
  try {
    worker_ = std::make_unique<std::thread>(&TransferTask::execute, this);
  }
  catch (const std::system_error& e) {
    BOOST_LOG_TRIVIAL(error) << name_ << ": Failed to launch worker thread: " << e.what();
    started_ = false;
    throw TransferError(TransferErrorKind::IO_FAILURE, name_ + ": " + e.what());
  }
  BOOST_LOG_TRIVIAL(debug) << name_ << ": Task started";
}

bool TransferTask::wait() {
  if (!started_) {
    throw TransferError(TransferErrorKind::CANCELLED, name_ + " was never started");
  }

  result_.wait();
  join_worker();
  return result_.get();
}

bool TransferTask::wait_until(Clock::time_point deadline) {
  if (!started_) {
    return false;
  }
  return result_.wait_until(deadline) == std::future_status::ready;
}

void TransferTask::request_stop() {
  if (!stop_requested_.exchange(true) && started_ && !finished()) {
    BOOST_LOG_TRIVIAL(debug) << name_ << ": Stopping task";
    interrupt();
  }
}

bool TransferTask::finished() const {
  return result_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

void TransferTask::stop() {
  request_stop();
  join_worker();
}


//==============================================
// WORKER
//==============================================

void TransferTask::execute() {
  try {
    run();
    BOOST_LOG_TRIVIAL(debug) << name_ << ": Task completed";
    done_.set_value(true);
  }
  catch (const TransferError& e) {
    BOOST_LOG_TRIVIAL(error) << name_ << ": Task failed: " << e.what();
    done_.set_exception(std::current_exception());
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << name_ << ": Task failed with unexpected error: " << e.what();
    done_.set_exception(std::make_exception_ptr(
      TransferError(TransferErrorKind::IO_FAILURE, name_ + ": " + e.what())));
  }
  catch (...) {
    BOOST_LOG_TRIVIAL(error) << name_ << ": Task failed with unknown error";
    done_.set_exception(std::make_exception_ptr(
      TransferError(TransferErrorKind::IO_FAILURE, name_ + ": unknown error")));
  }
}

void TransferTask::join_worker() {
  std::lock_guard<std::mutex> lock(worker_mutex_);
  if (worker_ && worker_->joinable() && worker_->get_id() != std::this_thread::get_id()) {
    worker_->join();
    worker_.reset();
  }
}

} // namespace transfer
} // namespace imgxfer
