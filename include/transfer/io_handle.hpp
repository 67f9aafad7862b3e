#ifndef IMGXFER_TRANSFER_IO_HANDLE_HPP
#define IMGXFER_TRANSFER_IO_HANDLE_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace imgxfer {
namespace transfer {

// Unit of bytes exchanged between producer and consumer, empty means end-of-stream
using Chunk = std::vector<uint8_t>;

// Size of every read issued by a copy loop
constexpr std::size_t READ_CHUNK_SIZE = 64 * 1024;

class ProgressSink {
public:
  virtual ~ProgressSink() = default;

  // Receives a notification after every chunk moved through the handle
  virtual void update_progress() {}
};

class ReadHandle : public virtual ProgressSink {
public:
  ReadHandle(const ReadHandle&) = delete;
  ReadHandle& operator=(const ReadHandle&) = delete;
  ~ReadHandle() override = default;

  // Returns at most size bytes, an empty chunk once the stream is exhausted
  virtual Chunk read(std::size_t size) = 0;
  virtual void close() {}
  // Called from another thread to abort a blocked read, later reads fail
  virtual void cancel() {}

protected:
  ReadHandle() = default;
};

class WriteHandle : public virtual ProgressSink {
public:
  WriteHandle(const WriteHandle&) = delete;
  WriteHandle& operator=(const WriteHandle&) = delete;
  ~WriteHandle() override = default;

  virtual void write(const Chunk& data) = 0;
  virtual void close() {}
  // Called from another thread to abort a blocked write, later writes fail
  virtual void cancel() {}

protected:
  WriteHandle() = default;
};

// Raised by concrete handles when the underlying file or connection fails
class HandleError : public std::runtime_error {
public:
  explicit HandleError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace transfer
} // namespace imgxfer

#endif // IMGXFER_TRANSFER_IO_HANDLE_HPP
