#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "da/transport/byte_stream.h"

namespace da::transport {

struct Uri {
  std::string scheme;  // lower case
  std::string host;
  uint16_t port{0};
  std::string path;    // includes query, "/" when empty
};

// Accepts "scheme://host[:port]/path". Throws Error{Validation, kInvalidUri}.
Uri ParseUri(std::string_view text);

struct OpenedStream {
  std::unique_ptr<ByteStream> stream;
  // Offset of the first byte the stream yields. May be lower than the
  // requested start when the source cannot seek.
  uint64_t start_offset{0};
};

class RemoteSource {
public:
  virtual ~RemoteSource() = default;
  virtual OpenedStream Open(uint64_t start_byte) = 0;
  virtual std::string Describe() const = 0;
};

class FileRemoteSource final : public RemoteSource {
public:
  explicit FileRemoteSource(std::filesystem::path path);
  OpenedStream Open(uint64_t start_byte) override;
  std::string Describe() const override;

private:
  std::filesystem::path path_;
};

// HTTP/1.1 GET with "Range: bytes=<start>-" and "Connection: close".
class HttpRemoteSource final : public RemoteSource {
public:
  HttpRemoteSource(Uri uri, std::chrono::seconds receive_timeout);
  OpenedStream Open(uint64_t start_byte) override;
  std::string Describe() const override;

private:
  Uri uri_;
  std::chrono::seconds receive_timeout_;
};

// Dispatches on scheme: http:// and file://. Other schemes throw
// Error{Transport, kUnsupportedScheme}.
std::unique_ptr<RemoteSource> MakeRemoteSource(std::string_view uri, std::chrono::seconds http_timeout);

}  // namespace da::transport
