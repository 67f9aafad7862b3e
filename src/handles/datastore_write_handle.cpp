#include "handles/datastore_write_handle.hpp"
#include <cctype>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <boost/log/trivial.hpp>
#include <openssl/ssl.h>

namespace imgxfer {
namespace handles {

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace {

// Upper bound for any single network operation of the handle
constexpr std::chrono::seconds IO_TIMEOUT{60};

std::string percent_encode(const std::string& value, bool keep_slash) {
  std::ostringstream encoded;
  encoded << std::hex << std::uppercase << std::setfill('0');

  for (unsigned char c : value) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || (keep_slash && c == '/')) {
      encoded << c;
    } else {
      encoded << '%' << std::setw(2) << static_cast<int>(c);
    }
  }
  return encoded.str();
}

} // namespace

std::string build_datastore_url_path(const std::string& data_center_name,
                                     const std::string& datastore_name,
                                     const std::string& file_path) {
  std::string relative_path = file_path;
  relative_path.erase(0, relative_path.find_first_not_of('/'));

  return "/folder/" + percent_encode(relative_path, true) +
         "?dcPath=" + percent_encode(data_center_name, false) +
         "&dsName=" + percent_encode(datastore_name, false);
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

DatastoreWriteHandle::DatastoreWriteHandle(const std::string& host, const std::string& data_center_name,
                                           const std::string& datastore_name, const Cookies& cookies,
                                           const std::string& file_path, uint64_t file_size,
                                           uint16_t port)
  : host_(host)
  , url_path_(build_datastore_url_path(data_center_name, datastore_name, file_path))
  , file_size_(file_size)
  , ssl_context_(ssl::context::tls_client) {
  BOOST_LOG_TRIVIAL(info) << "Datastore handle: Opening PUT https://" << host_ << ":" << port
                          << url_path_ << " for " << file_size_ << " bytes";

  ssl_context_.set_default_verify_paths();
  ssl_context_.set_verify_mode(ssl::verify_peer);
  connect(port, cookies);
}

// Destroying an open handle abandons the upload without reading a response
DatastoreWriteHandle::~DatastoreWriteHandle() {
  if (!closed_) {
    cleanup_connection();
  }
}


//==============================================
// WRITE HANDLE INTERFACE
//==============================================

void DatastoreWriteHandle::write(const transfer::Chunk& data) {
  if (cancelled_) {
    throw transfer::HandleError("Datastore handle: Upload cancelled");
  }
  if (closed_ || !serializer_) {
    throw transfer::HandleError("Datastore handle: Write on closed handle");
  }
  if (data.empty()) {
    return;
  }

  send_body(data.data(), data.size(), false);
  bytes_written_ += data.size();
}

void DatastoreWriteHandle::update_progress() {
  if (file_size_ > 0) {
    BOOST_LOG_TRIVIAL(trace) << "Datastore handle: Progress " << (bytes_written_ * 100 / file_size_) << "%";
  }
}

void DatastoreWriteHandle::close() {
  if (closed_ || !serializer_) {
    return;
  }
  closed_ = true;

  if (cancelled_) {
    cleanup_connection();
    throw transfer::HandleError("Datastore handle: Upload cancelled after " +
                                std::to_string(bytes_written_) + " bytes, connection dropped");
  }

  if (bytes_written_ != file_size_) {
    BOOST_LOG_TRIVIAL(warning) << "Datastore handle: Closing after " << bytes_written_
                               << " bytes, " << file_size_ << " were announced";
  }

  try {
    send_body(nullptr, 0, true);

    beast::error_code ec;
    beast::flat_buffer buffer;
    http::response<http::string_body> response;
    beast::get_lowest_layer(*stream_).expires_after(IO_TIMEOUT);
    http::async_read(*stream_, buffer, response,
                     [&ec](const beast::error_code& e, std::size_t) { ec = e; });
    io_context_.restart();
    io_context_.run();
    if (ec) {
      throw transfer::HandleError("Datastore handle: Failed to read response: " + ec.message());
    }

    BOOST_LOG_TRIVIAL(debug) << "Datastore handle: Server replied " << response.result_int();
    if (response.result() != http::status::ok && response.result() != http::status::created) {
      throw transfer::HandleError("Datastore handle: Upload rejected with HTTP status " +
                                  std::to_string(response.result_int()));
    }
  }
  catch (const transfer::HandleError&) {
    cleanup_connection();
    throw;
  }

  beast::error_code ec;
  beast::get_lowest_layer(*stream_).expires_after(IO_TIMEOUT);
  stream_->async_shutdown([&ec](const beast::error_code& e) { ec = e; });
  io_context_.restart();
  io_context_.run();
  // Servers commonly drop the connection instead of answering close_notify
  if (ec && ec != boost::asio::error::eof && ec != ssl::error::stream_truncated) {
    BOOST_LOG_TRIVIAL(debug) << "Datastore handle: TLS shutdown: " << ec.message();
  }
  cleanup_connection();

  BOOST_LOG_TRIVIAL(info) << "Datastore handle: Uploaded " << bytes_written_ << " bytes to " << url_path_;
}


void DatastoreWriteHandle::cancel() {
  if (cancelled_.exchange(true)) {
    return;
  }
  BOOST_LOG_TRIVIAL(warning) << "Datastore handle: Cancelling upload to " << url_path_;

  // Runs on the thread driving io_context_, the pending operation completes with an error
  boost::asio::post(io_context_, [this]() {
    beast::error_code ec;
    beast::get_lowest_layer(*stream_).socket().close(ec);
  });
}


//==============================================
// CONNECTION MANAGEMENT
//==============================================

void DatastoreWriteHandle::connect(uint16_t port, const Cookies& cookies) {
  beast::error_code ec;

  tcp::resolver resolver(io_context_);
  auto endpoints = resolver.resolve(host_, std::to_string(port), ec);
  if (ec) {
    throw transfer::HandleError("Datastore handle: Cannot resolve " + host_ + ": " + ec.message());
  }

  stream_ = std::make_unique<SslStream>(io_context_, ssl_context_);
  if (!SSL_set_tlsext_host_name(stream_->native_handle(), host_.c_str())) {
    throw transfer::HandleError("Datastore handle: Failed to set TLS server name for " + host_);
  }
  stream_->set_verify_callback(ssl::host_name_verification(host_));

  beast::get_lowest_layer(*stream_).expires_after(IO_TIMEOUT);
  beast::get_lowest_layer(*stream_).async_connect(
    endpoints, [&ec](const beast::error_code& e, const tcp::endpoint&) { ec = e; });
  io_context_.run();
  if (ec) {
    throw transfer::HandleError("Datastore handle: Cannot connect to " + host_ + ": " + ec.message());
  }

  beast::get_lowest_layer(*stream_).expires_after(IO_TIMEOUT);
  stream_->async_handshake(ssl::stream_base::client, [&ec](const beast::error_code& e) { ec = e; });
  io_context_.restart();
  io_context_.run();
  if (ec) {
    cleanup_connection();
    throw transfer::HandleError("Datastore handle: TLS handshake with " + host_ + " failed: " + ec.message());
  }

  request_.method(http::verb::put);
  request_.target(url_path_);
  request_.version(11);
  request_.set(http::field::host, host_);
  request_.set(http::field::user_agent, "imgxfer");
  request_.set(http::field::content_type, "application/octet-stream");
  request_.content_length(file_size_);

  std::string cookie_header;
  for (const auto& cookie : cookies) {
    if (!cookie_header.empty()) {
      cookie_header += "; ";
    }
    cookie_header += cookie;
  }
  if (!cookie_header.empty()) {
    request_.set(http::field::cookie, cookie_header);
  }

  request_.body().data = nullptr;
  request_.body().more = true;
  serializer_ = std::make_unique<http::request_serializer<RequestBody>>(request_);

  beast::get_lowest_layer(*stream_).expires_after(IO_TIMEOUT);
  http::async_write_header(*stream_, *serializer_,
                           [&ec](const beast::error_code& e, std::size_t) { ec = e; });
  io_context_.restart();
  io_context_.run();
  if (ec) {
    cleanup_connection();
    throw transfer::HandleError("Datastore handle: Failed to send request header: " + ec.message());
  }
  BOOST_LOG_TRIVIAL(debug) << "Datastore handle: Request header sent";
}

void DatastoreWriteHandle::send_body(const void* data, std::size_t size, bool last) {
  request_.body().data = const_cast<void*>(data);
  request_.body().size = size;
  request_.body().more = !last;

  beast::error_code ec;
  beast::get_lowest_layer(*stream_).expires_after(IO_TIMEOUT);
  http::async_write(*stream_, *serializer_,
                    [&ec](const beast::error_code& e, std::size_t) { ec = e; });
  io_context_.restart();
  io_context_.run();

  // The serializer asks for the next buffer once this one is on the wire
  if (ec == http::error::need_buffer) {
    ec = {};
  }
  if (ec) {
    throw transfer::HandleError("Datastore handle: Failed to send data: " + ec.message());
  }
}

void DatastoreWriteHandle::cleanup_connection() {
  if (!stream_) {
    return;
  }

  beast::error_code ec;
  beast::get_lowest_layer(*stream_).socket().close(ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Datastore handle: Error closing socket: " << ec.message();
  }
  serializer_.reset();
}

} // namespace handles
} // namespace imgxfer
