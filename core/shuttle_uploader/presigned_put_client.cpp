// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "presigned_put_client.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <optional>
#include <regex>
#include <type_traits>
#include <utility>

#define SHUTTLE_LOG_COMPONENT "put_client"
#include <shuttle_log_macros.hpp>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace shuttle {
namespace uploader {

namespace {

constexpr size_t kMaxErrorBodyInMessage = 256;
constexpr std::chrono::milliseconds kEarlyResponseWait{2000};

template<typename Stream>
struct is_ssl_stream : std::false_type {};

template<typename NextLayer>
struct is_ssl_stream<beast::ssl_stream<NextLayer>> : std::true_type {};

/**
 * Async PUT driven to completion by a private io_context
 *
 * resolve -> connect -> (TLS handshake) -> header -> body chunks -> response.
 * forceClose() may be called from any thread; it posts the close onto the
 * io_context so the socket is only touched by the thread running it.
 */
template<typename Stream>
class PutOperation : public ICancellableHandle {
public:
  PutOperation(
    net::io_context& ioc, Stream& stream, const ParsedUrl& url, const HttpClientConfig& config,
    const char* data, size_t size, const PartProgressCallback& progress
  )
      : ioc_(ioc)
      , stream_(stream)
      , resolver_(ioc)
      , url_(url)
      , config_(config)
      , data_(data)
      , size_(size)
      , progress_(progress) {}

  void forceClose() override {
    closed_.store(true, std::memory_order_release);
    net::post(ioc_, [this] {
      resolver_.cancel();
      beast::get_lowest_layer(stream_).close();
    });
  }

  void start() {
    resolver_.async_resolve(
      url_.host,
      url_.port,
      [this](beast::error_code ec, tcp::resolver::results_type results) {
        onResolve(ec, results);
      }
    );
  }

  PutResult result(const CancellationToken& token) const {
    if (closed_.load(std::memory_order_acquire) || token.isCancelled()) {
      return PutResult::Failure(UploadErrorCode::Cancelled, "request cancelled");
    }
    if (ec_) {
      if (ec_ == beast::error::timeout) {
        return PutResult::Failure(
          UploadErrorCode::NetworkError, "timed out during " + std::string(stage_)
        );
      }
      return PutResult::Failure(
        UploadErrorCode::NetworkError, std::string(stage_) + " failed: " + ec_.message()
      );
    }

    int status = static_cast<int>(response_.result_int());
    if (early_response_ && status >= 200 && status < 300) {
      return PutResult::Failure(
        UploadErrorCode::NetworkError,
        "server answered " + std::to_string(status) + " before the body was sent"
      );
    }
    if (status < 200 || status >= 300) {
      std::string body = response_.body().substr(0, kMaxErrorBodyInMessage);
      return PutResult::Failure(
        UploadErrorCode::HttpError,
        "HTTP " + std::to_string(status) + (body.empty() ? "" : ": " + body),
        status
      );
    }

    std::string etag = unquoteEtag(std::string(response_[http::field::etag]));
    return PutResult::Success(status, etag);
  }

private:
  bool abortIfClosed(const char* stage) {
    if (closed_.load(std::memory_order_acquire)) {
      fail(net::error::operation_aborted, stage);
      return true;
    }
    return false;
  }

  void fail(beast::error_code ec, const char* stage) {
    ec_ = ec;
    stage_ = stage;
    beast::error_code ignored;
    beast::get_lowest_layer(stream_).socket().close(ignored);
  }

  void onResolve(beast::error_code ec, const tcp::resolver::results_type& results) {
    if (ec) {
      return fail(ec, "resolve");
    }
    if (abortIfClosed("resolve")) {
      return;
    }
    beast::get_lowest_layer(stream_).expires_after(config_.connect_timeout);
    beast::get_lowest_layer(stream_).async_connect(
      results,
      [this](beast::error_code ec, const tcp::resolver::results_type::endpoint_type&) {
        onConnect(ec);
      }
    );
  }

  void onConnect(beast::error_code ec) {
    if (ec) {
      return fail(ec, "connect");
    }
    if (abortIfClosed("connect")) {
      return;
    }
    if constexpr (is_ssl_stream<Stream>::value) {
      beast::get_lowest_layer(stream_).expires_after(config_.connect_timeout);
      stream_.async_handshake(ssl::stream_base::client, [this](beast::error_code ec) {
        onHandshake(ec);
      });
    } else {
      onHandshake(beast::error_code{});
    }
  }

  void onHandshake(beast::error_code ec) {
    if (ec) {
      return fail(ec, "TLS handshake");
    }

    // One deadline for the whole request: header, body and response
    beast::get_lowest_layer(stream_).expires_after(config_.request_timeout);

    request_.method(http::verb::put);
    request_.target(url_.target);
    request_.version(11);
    request_.set(http::field::host, url_.hostHeader());
    request_.set(http::field::user_agent, "shuttle/1.0");
    request_.content_length(size_);

    serializer_.emplace(request_);
    http::async_write_header(stream_, *serializer_, [this](beast::error_code ec, std::size_t) {
      onHeader(ec);
    });
  }

  void onHeader(beast::error_code ec) {
    if (ec) {
      return readEarlyResponse(ec, "write header");
    }
    writeChunk();
  }

  void writeChunk() {
    if (abortIfClosed("write body")) {
      return;
    }
    if (offset_ >= size_) {
      readResponse();
      return;
    }
    size_t n = std::min(config_.chunk_size, size_ - offset_);
    net::async_write(
      stream_,
      net::buffer(data_ + offset_, n),
      [this](beast::error_code ec, std::size_t written) { onChunk(ec, written); }
    );
  }

  void onChunk(beast::error_code ec, std::size_t written) {
    if (ec) {
      return readEarlyResponse(ec, "write body");
    }
    offset_ += written;
    if (progress_) {
      progress_(static_cast<uint64_t>(offset_));
    }
    writeChunk();
  }

  // Stores reject a bad or expired signature right after the headers and close
  // the connection, so a failed write may still have a response waiting.
  void readEarlyResponse(beast::error_code write_ec, const char* stage) {
    if (closed_.load(std::memory_order_acquire) || write_ec == beast::error::timeout) {
      return fail(write_ec, stage);
    }
    beast::get_lowest_layer(stream_).expires_after(
      std::min<std::chrono::milliseconds>(config_.request_timeout, kEarlyResponseWait)
    );
    http::async_read(
      stream_,
      buffer_,
      response_,
      [this, write_ec, stage](beast::error_code ec, std::size_t) {
        if (ec || closed_.load(std::memory_order_acquire)) {
          return fail(write_ec, stage);
        }
        early_response_ = true;
        beast::error_code ignored;
        beast::get_lowest_layer(stream_).socket().close(ignored);
      }
    );
  }

  void readResponse() {
    http::async_read(stream_, buffer_, response_, [this](beast::error_code ec, std::size_t) {
      if (ec) {
        return fail(ec, "read response");
      }
      beast::error_code ignored;
      beast::get_lowest_layer(stream_).socket().shutdown(tcp::socket::shutdown_both, ignored);
    });
  }

  net::io_context& ioc_;
  Stream& stream_;
  tcp::resolver resolver_;
  const ParsedUrl& url_;
  const HttpClientConfig& config_;
  const char* data_;
  size_t size_;
  size_t offset_ = 0;
  const PartProgressCallback& progress_;

  http::request<http::empty_body> request_;
  std::optional<http::request_serializer<http::empty_body>> serializer_;
  beast::flat_buffer buffer_;
  http::response<http::string_body> response_;

  std::atomic<bool> closed_{false};
  bool early_response_ = false;
  beast::error_code ec_;
  const char* stage_ = "";
};

template<typename Stream>
PutResult run_put(
  net::io_context& ioc, Stream& stream, const ParsedUrl& url, const HttpClientConfig& config,
  const char* data, size_t size, const PartProgressCallback& progress, CancellationToken& token
) {
  PutOperation<Stream> op(ioc, stream, url, config, data, size, progress);

  auto registration = token.registerHandle(&op);
  if (registration.cancelled()) {
    return PutResult::Failure(UploadErrorCode::Cancelled, "request cancelled");
  }

  op.start();
  ioc.run();

  // Stop accepting force-closes before op goes out of scope
  registration.release();
  return op.result(token);
}

}  // namespace

std::string ParsedUrl::hostHeader() const {
  bool default_port = (use_ssl && port == "443") || (!use_ssl && port == "80");
  return default_port ? host : host + ":" + port;
}

PresignedPutClient::PresignedPutClient(
  std::shared_ptr<IObjectStore> store, const HttpClientConfig& config
)
    : store_(std::move(store))
    , config_(config) {
  if (config_.chunk_size == 0) {
    config_.chunk_size = 64 * 1024;
  }
}

bool PresignedPutClient::parse_url(const std::string& url, ParsedUrl& out) {
  // Format: http(s)://host(:port)/path?query
  static const std::regex url_regex(R"(^(https?)://([^/:?#]+)(?::(\d+))?([/?].*)?$)", std::regex::icase);
  std::smatch match;

  if (!std::regex_match(url, match, url_regex)) {
    return false;
  }

  std::string scheme = match[1].str();
  std::transform(scheme.begin(), scheme.end(), scheme.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  out.use_ssl = (scheme == "https");
  out.host = match[2].str();
  out.port = match[3].matched ? match[3].str() : (out.use_ssl ? "443" : "80");
  out.target = match[4].matched ? match[4].str() : "/";
  if (out.target.empty()) {
    out.target = "/";
  } else if (out.target.front() == '?') {
    out.target = "/" + out.target;
  }
  return true;
}

PresignResult PresignedPutClient::presign(
  const std::string& bucket, const std::string& key, const std::string& upload_id,
  int part_number, std::chrono::seconds ttl
) {
  auto result = store_->presignPartUrl(bucket, key, upload_id, part_number, ttl);
  if (!result.success) {
    return PresignResult::Failure(
      "cannot presign part " + std::to_string(part_number) + ": " + result.error_message
    );
  }
  return PresignResult::Success(result.value);
}

PutResult PresignedPutClient::putRange(
  const std::string& url, const char* data, size_t size, const PartProgressCallback& progress,
  CancellationToken& token
) {
  if (token.isCancelled()) {
    return PutResult::Failure(UploadErrorCode::Cancelled, "request cancelled");
  }

  ParsedUrl parsed;
  if (!parse_url(url, parsed)) {
    return PutResult::Failure(UploadErrorCode::SigningError, "malformed pre-signed URL");
  }

  try {
    net::io_context ioc;

    if (parsed.use_ssl) {
      ssl::context ctx(ssl::context::tlsv12_client);
      ctx.set_default_verify_paths();
      ctx.set_verify_mode(config_.verify_ssl ? ssl::verify_peer : ssl::verify_none);

      beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);

      // Set SNI hostname (required for most servers)
      if (!SSL_set_tlsext_host_name(stream.native_handle(), parsed.host.c_str())) {
        beast::error_code ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
        return PutResult::Failure(
          UploadErrorCode::NetworkError, "SNI hostname failed: " + ec.message()
        );
      }
      if (config_.verify_ssl) {
        stream.set_verify_callback(ssl::host_name_verification(parsed.host));
      }

      return run_put(ioc, stream, parsed, config_, data, size, progress, token);
    }

    beast::tcp_stream stream(ioc);
    return run_put(ioc, stream, parsed, config_, data, size, progress, token);

  } catch (const std::exception& e) {
    SHUTTLE_LOG_WARN("PUT raised" << logging::kv("host", parsed.host) << logging::kv("error", e.what()));
    return PutResult::Failure(UploadErrorCode::NetworkError, e.what());
  }
}

}  // namespace uploader
}  // namespace shuttle
