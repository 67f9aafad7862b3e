#include "handles/file_handles.hpp"
#include <boost/log/trivial.hpp>

namespace imgxfer {
namespace handles {

//==============================================
// LOCAL FILE READ HANDLE
//==============================================

LocalFileReadHandle::LocalFileReadHandle(const std::filesystem::path& path)
  : path_(path)
  , file_(path, std::ios::binary) {
  if (!file_) {
    BOOST_LOG_TRIVIAL(error) << "File handle: Failed to open " << path_.string() << " for reading";
    throw transfer::HandleError("File handle: Failed to open file: " + path_.string());
  }
  file_size_ = std::filesystem::file_size(path_);
  BOOST_LOG_TRIVIAL(debug) << "File handle: Opened " << path_.string() << " (" << file_size_ << " bytes)";
}

transfer::Chunk LocalFileReadHandle::read(std::size_t size) {
  if (!file_.is_open() || file_.eof()) {
    return {};
  }

  transfer::Chunk data(size);
  file_.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(size));
  if (file_.bad()) {
    throw transfer::HandleError("File handle: Failed to read from " + path_.string());
  }

  data.resize(static_cast<std::size_t>(file_.gcount()));
  return data;
}

void LocalFileReadHandle::close() {
  if (file_.is_open()) {
    file_.close();
  }
}


//==============================================
// LOCAL FILE WRITE HANDLE
//==============================================

LocalFileWriteHandle::LocalFileWriteHandle(const std::filesystem::path& path)
  : path_(path)
  , file_(path, std::ios::binary | std::ios::trunc) {
  if (!file_) {
    BOOST_LOG_TRIVIAL(error) << "File handle: Failed to open " << path_.string() << " for writing";
    throw transfer::HandleError("File handle: Failed to create file: " + path_.string());
  }
}

void LocalFileWriteHandle::write(const transfer::Chunk& data) {
  if (!file_.is_open()) {
    throw transfer::HandleError("File handle: Write to closed file: " + path_.string());
  }

  file_.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
  if (!file_) {
    throw transfer::HandleError("File handle: Failed to write to " + path_.string());
  }
  bytes_written_ += data.size();
}

void LocalFileWriteHandle::close() {
  if (!file_.is_open()) {
    return;
  }

  file_.flush();
  bool flushed = file_.good();
  file_.close();
  if (!flushed) {
    throw transfer::HandleError("File handle: Failed to flush " + path_.string());
  }
  BOOST_LOG_TRIVIAL(debug) << "File handle: Wrote " << bytes_written_ << " bytes to " << path_.string();
}

} // namespace handles
} // namespace imgxfer
