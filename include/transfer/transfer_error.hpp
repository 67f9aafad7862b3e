#ifndef IMGXFER_TRANSFER_ERROR_HPP
#define IMGXFER_TRANSFER_ERROR_HPP

#include <stdexcept>
#include <string>

namespace imgxfer {
namespace transfer {

enum class TransferErrorKind {
  IO_FAILURE,
  IMAGE_KILLED,
  UNKNOWN_STATUS,
  STATUS_UNAVAILABLE,
  TIMEOUT,
  QUEUE_CLOSED,
  CANCELLED
};

inline const char* transfer_error_to_string(TransferErrorKind kind) {
  switch (kind) {
    case TransferErrorKind::IO_FAILURE: return "I/O failure";
    case TransferErrorKind::IMAGE_KILLED: return "Image killed";
    case TransferErrorKind::UNKNOWN_STATUS: return "Unknown image status";
    case TransferErrorKind::STATUS_UNAVAILABLE: return "Image status unavailable";
    case TransferErrorKind::TIMEOUT: return "Timeout";
    case TransferErrorKind::QUEUE_CLOSED: return "Queue closed";
    case TransferErrorKind::CANCELLED: return "Cancelled";
    default: return "Undefined error";
  }
}

// The only exception type raised out of the transfer core
class TransferError : public std::runtime_error {
public:
  TransferError(TransferErrorKind kind, const std::string& message)
    : std::runtime_error(std::string(transfer_error_to_string(kind)) + ": " + message)
    , kind_(kind) {}

  TransferErrorKind kind() const { return kind_; }

private:
  TransferErrorKind kind_;
};

} // namespace transfer
} // namespace imgxfer

#endif // IMGXFER_TRANSFER_ERROR_HPP
