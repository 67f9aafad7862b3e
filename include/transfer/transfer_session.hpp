#ifndef IMGXFER_TRANSFER_TRANSFER_SESSION_HPP
#define IMGXFER_TRANSFER_TRANSFER_SESSION_HPP

#include <chrono>
#include <cstdint>

namespace imgxfer {
namespace transfer {

enum class TransferOutcome {
  IN_PROGRESS,
  SUCCEEDED,
  FAILED,
  TIMED_OUT
};

inline const char* transfer_outcome_to_string(TransferOutcome outcome) {
  switch (outcome) {
    case TransferOutcome::IN_PROGRESS: return "in progress";
    case TransferOutcome::SUCCEEDED: return "succeeded";
    case TransferOutcome::FAILED: return "failed";
    case TransferOutcome::TIMED_OUT: return "timed out";
    default: return "undefined";
  }
}

// One image move, owned by the start_transfer call that created it
struct TransferSession {
  using Clock = std::chrono::steady_clock;

  TransferSession(uint64_t total_size, std::chrono::seconds timeout)
    : total_size(total_size)
    , started(Clock::now())
    , deadline(started + timeout) {}

  double elapsed_seconds() const {
    return std::chrono::duration<double>(Clock::now() - started).count();
  }

  uint64_t total_size;
  uint64_t bytes_transferred{0};
  Clock::time_point started;
  Clock::time_point deadline;
  TransferOutcome outcome{TransferOutcome::IN_PROGRESS};
};

} // namespace transfer
} // namespace imgxfer

#endif // IMGXFER_TRANSFER_TRANSFER_SESSION_HPP
