#include "da/transport/remote_source.h"

#include <cerrno>
#include <charconv>
#include <cstdint>
#include <limits>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "da/error.h"

namespace da::transport {
namespace {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

[[noreturn]] void ThrowTransport(int code, std::string message, std::optional<int> native = std::nullopt) {
  throw Error{ErrorDomain::Transport, code, std::move(message), native, Retryability::kTransient};
}

std::string_view ToStd(beast::string_view view) {
  return std::string_view(view.data(), view.size());
}

std::optional<uint64_t> ParseUnsigned(std::string_view text) {
  uint64_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size() || text.empty()) {
    return std::nullopt;
  }
  return value;
}

// "bytes <first>-<last>/<total>" -> first
std::optional<uint64_t> ParseContentRangeStart(std::string_view value) {
  while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
    value.remove_prefix(1);
  }
  if (value.substr(0, 6) != "bytes ") {
    return std::nullopt;
  }
  value.remove_prefix(6);
  const auto dash = value.find('-');
  if (dash == std::string_view::npos) {
    return std::nullopt;
  }
  return ParseUnsigned(value.substr(0, dash));
}

// One HTTP exchange. Every socket operation runs asynchronously on a private
// io_context so the receive timeout can bound it.
struct Connection {
  explicit Connection(std::chrono::seconds receive_timeout) : stream(ioc), timeout(receive_timeout) {
    parser.body_limit(std::numeric_limits<std::uint64_t>::max());
  }

  template <typename Initiate>
  beast::error_code Run(Initiate&& initiate) {
    beast::error_code result;
    if (timeout.count() > 0) {
      stream.expires_after(timeout);
    } else {
      stream.expires_never();
    }
    initiate([&result](beast::error_code ec, auto&&...) { result = ec; });
    ioc.restart();
    ioc.run();
    return result;
  }

  net::io_context ioc;
  beast::tcp_stream stream;
  beast::flat_buffer buffer;
  http::response_parser<http::buffer_body> parser;
  std::chrono::seconds timeout;
};

[[noreturn]] void ThrowReceiveError(const beast::error_code& ec, std::string_view what) {
  if (ec == beast::error::timeout) {
    ThrowTransport(errors::transport::kReadFailed, "Timed out waiting for HTTP data", ETIMEDOUT);
  }
  if (ec == http::error::partial_message || ec == net::error::eof || ec == net::error::connection_reset) {
    ThrowTransport(errors::transport::kReadFailed, "Connection closed " + std::string(what) + ": " + ec.message());
  }
  if (ec.category() == http::make_error_code(http::error::bad_chunk).category()) {
    ThrowTransport(errors::transport::kProtocolError, "Malformed HTTP response " + std::string(what) + ": " +
                                                          ec.message());
  }
  ThrowTransport(errors::transport::kReadFailed, "HTTP receive failed " + std::string(what) + ": " + ec.message(),
                 ec.value());
}

class HttpByteStream final : public ByteStream {
public:
  explicit HttpByteStream(std::unique_ptr<Connection> connection) : connection_(std::move(connection)) {}

  size_t Read(std::span<uint8_t> buffer) override {
    auto& parser = connection_->parser;
    while (!buffer.empty() && !parser.is_done()) {
      auto& body = parser.get().body();
      body.data = buffer.data();
      body.size = buffer.size();
      beast::error_code ec = connection_->Run([this](auto handler) {
        http::async_read(connection_->stream, connection_->buffer, connection_->parser, std::move(handler));
      });
      if (ec == http::error::need_buffer) {
        ec = {};
      }
      if (ec) {
        ThrowReceiveError(ec, "inside the response body");
      }
      const size_t got = buffer.size() - parser.get().body().size;
      if (got > 0) {
        return got;
      }
    }
    return 0;
  }

  std::optional<uint64_t> DeclaredLength() const override {
    if (auto length = connection_->parser.content_length()) {
      return *length;
    }
    return std::nullopt;
  }

  std::optional<std::string> Header(std::string_view name) const override {
    const auto& fields = connection_->parser.get();
    auto it = fields.find(beast::string_view(name.data(), name.size()));
    if (it == fields.end()) {
      return std::nullopt;
    }
    return std::string(ToStd(it->value()));
  }

private:
  std::unique_ptr<Connection> connection_;
};

}  // namespace

HttpRemoteSource::HttpRemoteSource(Uri uri, std::chrono::seconds receive_timeout)
    : uri_(std::move(uri)), receive_timeout_(receive_timeout) {}

std::string HttpRemoteSource::Describe() const {
  return uri_.scheme + "://" + uri_.host + ":" + std::to_string(uri_.port) + uri_.path;
}

OpenedStream HttpRemoteSource::Open(uint64_t start_byte) {
  auto connection = std::make_unique<Connection>(receive_timeout_);
  const std::string port = std::to_string(uri_.port);

  beast::error_code ec;
  tcp::resolver resolver(connection->ioc);
  const auto endpoints = resolver.resolve(uri_.host, port, ec);
  if (ec) {
    ThrowTransport(errors::transport::kConnectFailed, "Failed to resolve " + uri_.host + ": " + ec.message(),
                   ec.value());
  }
  ec = connection->Run([&](auto handler) { connection->stream.async_connect(endpoints, std::move(handler)); });
  if (ec) {
    ThrowTransport(errors::transport::kConnectFailed,
                   "Failed to connect to " + uri_.host + ":" + port + ": " + ec.message(), ec.value());
  }

  http::request<http::empty_body> request{http::verb::get, uri_.path, 11};
  std::string host = uri_.host.find(':') != std::string::npos ? "[" + uri_.host + "]" : uri_.host;
  if (uri_.port != 80) {
    host += ":" + port;
  }
  request.set(http::field::host, host);
  if (start_byte > 0) {
    request.set(http::field::range, "bytes=" + std::to_string(start_byte) + "-");
  }
  request.set(http::field::user_agent, "da-ingest");
  request.set(http::field::accept, "*/*");
  request.set(http::field::connection, "close");
  ec = connection->Run([&](auto handler) { http::async_write(connection->stream, request, std::move(handler)); });
  if (ec) {
    ThrowTransport(errors::transport::kReadFailed, "Failed to send HTTP request: " + ec.message(), ec.value());
  }

  ec = connection->Run([&](auto handler) {
    http::async_read_header(connection->stream, connection->buffer, connection->parser, std::move(handler));
  });
  if (ec) {
    ThrowReceiveError(ec, "before the response head");
  }

  const auto& head = connection->parser.get();
  const unsigned status = head.result_int();
  OpenedStream opened;
  if (status == 200) {
    opened.start_offset = 0;
  } else if (status == 206) {
    std::optional<uint64_t> first;
    if (auto it = head.find(http::field::content_range); it != head.end()) {
      first = ParseContentRangeStart(ToStd(it->value()));
    }
    if (!first) {
      ThrowTransport(errors::transport::kProtocolError, "206 response without a usable Content-Range");
    }
    opened.start_offset = *first;
  } else if (status == 416 && start_byte > 0) {
    // Nothing left past the offset: the partial file is already complete.
    opened.stream = std::make_unique<MemoryByteStream>(std::string_view{}, 0);
    opened.start_offset = start_byte;
    return opened;
  } else {
    ThrowTransport(errors::transport::kHttpStatus,
                   "HTTP GET " + Describe() + " returned status " + std::to_string(status));
  }
  opened.stream = std::make_unique<HttpByteStream>(std::move(connection));
  return opened;
}

}  // namespace da::transport
