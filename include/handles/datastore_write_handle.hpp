#ifndef IMGXFER_HANDLES_DATASTORE_WRITE_HANDLE_HPP
#define IMGXFER_HANDLES_DATASTORE_WRITE_HANDLE_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include "transfer/io_handle.hpp"

namespace imgxfer {
namespace handles {

// Session cookies in "name=value" form, sent with every datastore request
using Cookies = std::vector<std::string>;

// Builds "/folder/<file_path>?dcPath=<dc>&dsName=<ds>" with every component percent-encoded
std::string build_datastore_url_path(const std::string& data_center_name,
                                     const std::string& datastore_name,
                                     const std::string& file_path);

/**
 * Streams bytes into a datastore file with a single HTTPS PUT. The request
 * header announces file_size up front, every write() sends its bytes as part
 * of the body and close() collects the server's response.
 */
class DatastoreWriteHandle : public transfer::WriteHandle {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  DatastoreWriteHandle(const std::string& host, const std::string& data_center_name,
                       const std::string& datastore_name, const Cookies& cookies,
                       const std::string& file_path, uint64_t file_size,
                       uint16_t port = 443);
  ~DatastoreWriteHandle() override;


  // ---- WRITE HANDLE INTERFACE ----
  void write(const transfer::Chunk& data) override;
  void update_progress() override;
  // Finishes the request and checks the response status, after cancel()
  // it only drops the connection
  void close() override;
  // Closes the socket from another thread, aborting the pending operation
  void cancel() override;


  // ---- GETTERS ----
  uint64_t bytes_written() const { return bytes_written_; }

private:
  using SslStream = boost::asio::ssl::stream<boost::beast::tcp_stream>;
  using RequestBody = boost::beast::http::buffer_body;

  // ---- PARAMETERS ----
  std::string host_;
  std::string url_path_;
  uint64_t file_size_;
  uint64_t bytes_written_{0};
  bool closed_{false};
  std::atomic<bool> cancelled_{false};

  boost::asio::io_context io_context_;
  boost::asio::ssl::context ssl_context_;
  std::unique_ptr<SslStream> stream_;
  boost::beast::http::request<RequestBody> request_;
  std::unique_ptr<boost::beast::http::request_serializer<RequestBody>> serializer_;


  // ---- CONNECTION MANAGEMENT ----
  // Resolves the host, performs the TLS handshake and sends the request header
  void connect(uint16_t port, const Cookies& cookies);
  // Writes one buffer of body bytes through the serializer
  void send_body(const void* data, std::size_t size, bool last);
  // Releases the connection without reading a response
  void cleanup_connection();
};

} // namespace handles
} // namespace imgxfer

#endif // IMGXFER_HANDLES_DATASTORE_WRITE_HANDLE_HPP
