#ifndef IMGXFER_HANDLES_FILE_HANDLES_HPP
#define IMGXFER_HANDLES_FILE_HANDLES_HPP

#include <cstdint>
#include <filesystem>
#include <fstream>
#include "transfer/io_handle.hpp"

namespace imgxfer {
namespace handles {

class LocalFileReadHandle : public transfer::ReadHandle {
public:
  explicit LocalFileReadHandle(const std::filesystem::path& path);

  transfer::Chunk read(std::size_t size) override;
  void close() override;

  uint64_t file_size() const { return file_size_; }

private:
  std::filesystem::path path_;
  std::ifstream file_;
  uint64_t file_size_{0};
};

class LocalFileWriteHandle : public transfer::WriteHandle {
public:
  explicit LocalFileWriteHandle(const std::filesystem::path& path);

  void write(const transfer::Chunk& data) override;
  // Flushes and closes the file, throws if the flush fails
  void close() override;

  uint64_t bytes_written() const { return bytes_written_; }

private:
  std::filesystem::path path_;
  std::ofstream file_;
  uint64_t bytes_written_{0};
};

} // namespace handles
} // namespace imgxfer

#endif // IMGXFER_HANDLES_FILE_HANDLES_HPP
