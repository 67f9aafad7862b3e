#ifndef IMGXFER_TRANSFER_TRANSFER_TASK_HPP
#define IMGXFER_TRANSFER_TRANSFER_TASK_HPP

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace imgxfer {
namespace transfer {

/**
 * A unit of work launched on its own worker thread. start() returns at once,
 * wait() blocks until the work reaches a terminal state and either returns
 * true or throws the TransferError the work ended with.
 */
class TransferTask {
public:
  using Clock = std::chrono::steady_clock;

  TransferTask(const TransferTask&) = delete;
  TransferTask& operator=(const TransferTask&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit TransferTask(std::string name);
  virtual ~TransferTask();


  // ---- TASK CONTROL ----
  // Launches run() on a worker thread
  void start();
  // Blocks until the task finishes, returns true or throws TransferError
  bool wait();
  // Returns true if the task finished before the deadline
  bool wait_until(Clock::time_point deadline);
  // Requests termination and interrupts a still running task without joining
  void request_stop();
  // Requests termination and joins the worker
  void stop();


  // ---- GETTERS ----
  const std::string& name() const { return name_; }
  bool started() const { return started_; }
  bool stop_requested() const { return stop_requested_; }
  // True once the outcome is recorded
  bool finished() const;

protected:
  // Performs the work, throws on failure
  virtual void run() = 0;
  // Wakes run() out of any wait it can be woken from
  virtual void interrupt() {}

private:
  // ---- PARAMETERS ----
  std::string name_;
  std::promise<bool> done_;
  std::shared_future<bool> result_;
  std::unique_ptr<std::thread> worker_;
  std::mutex worker_mutex_;
  std::atomic<bool> started_{false};
  std::atomic<bool> stop_requested_{false};


  // ---- WORKER ----
  // Runs the task body and records its outcome
  void execute();
  void join_worker();
};

} // namespace transfer
} // namespace imgxfer

#endif // IMGXFER_TRANSFER_TRANSFER_TASK_HPP
