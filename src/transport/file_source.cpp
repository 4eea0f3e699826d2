#include "da/transport/remote_source.h"

#include <cerrno>
#include <charconv>
#include <cstring>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "da/common.h"
#include "da/error.h"

namespace da::transport {
namespace {

[[noreturn]] void ThrowInvalidUri(std::string_view text, const char* why) {
  throw Error{ErrorDomain::Validation, errors::validation::kInvalidUri,
              "Invalid URI '" + std::string(text) + "': " + why};
}

}  // namespace

Uri ParseUri(std::string_view text) {
  const auto scheme_end = text.find("://");
  if (scheme_end == std::string_view::npos || scheme_end == 0) {
    ThrowInvalidUri(text, "missing scheme");
  }
  Uri uri;
  uri.scheme = ToLowerAscii(text.substr(0, scheme_end));
  std::string_view rest = text.substr(scheme_end + 3);
  const auto path_start = rest.find('/');
  std::string_view authority = rest.substr(0, path_start);
  uri.path = path_start == std::string_view::npos ? "/" : std::string(rest.substr(path_start));

  std::string_view port_text;
  if (!authority.empty() && authority.front() == '[') {
    const auto close = authority.find(']');
    if (close == std::string_view::npos) {
      ThrowInvalidUri(text, "unterminated IPv6 literal");
    }
    uri.host = std::string(authority.substr(1, close - 1));
    if (close + 1 < authority.size()) {
      if (authority[close + 1] != ':') {
        ThrowInvalidUri(text, "junk after IPv6 literal");
      }
      port_text = authority.substr(close + 2);
    }
  } else {
    const auto colon = authority.rfind(':');
    if (colon != std::string_view::npos) {
      uri.host = std::string(authority.substr(0, colon));
      port_text = authority.substr(colon + 1);
    } else {
      uri.host = std::string(authority);
    }
  }

  if (!port_text.empty()) {
    unsigned value = 0;
    auto [ptr, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), value);
    if (ec != std::errc() || ptr != port_text.data() + port_text.size() || value == 0 || value > 65535) {
      ThrowInvalidUri(text, "bad port");
    }
    uri.port = static_cast<uint16_t>(value);
  } else if (uri.scheme == "http") {
    uri.port = 80;
  }
  if (uri.scheme == "http" && uri.host.empty()) {
    ThrowInvalidUri(text, "missing host");
  }
  return uri;
}

FileRemoteSource::FileRemoteSource(std::filesystem::path path) : path_(std::move(path)) {}

std::string FileRemoteSource::Describe() const { return "file://" + PathToUtf8String(path_); }

OpenedStream FileRemoteSource::Open(uint64_t start_byte) {
  int fd = ::open(path_.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    const int saved_errno = errno;
    throw Error{ErrorDomain::IO, saved_errno,
                "Failed to open " + PathToUtf8String(path_) + ": " + std::strerror(saved_errno), saved_errno};
  }
  struct stat st {};
  std::optional<uint64_t> length;
  if (::fstat(fd, &st) == 0 && S_ISREG(st.st_mode)) {
    const auto size = static_cast<uint64_t>(st.st_size);
    length = size > start_byte ? size - start_byte : 0;
  }
  if (start_byte > 0 && ::lseek(fd, static_cast<off_t>(start_byte), SEEK_SET) < 0) {
    const int saved_errno = errno;
    ::close(fd);
    throw Error{ErrorDomain::IO, saved_errno,
                "Failed to seek " + PathToUtf8String(path_) + ": " + std::strerror(saved_errno), saved_errno};
  }
  OpenedStream opened;
  opened.stream = std::make_unique<FdByteStream>(fd, true, length);
  opened.start_offset = start_byte;
  return opened;
}

std::unique_ptr<RemoteSource> MakeRemoteSource(std::string_view uri, std::chrono::seconds http_timeout) {
  Uri parsed = ParseUri(uri);
  if (parsed.scheme == "http") {
    return std::make_unique<HttpRemoteSource>(std::move(parsed), http_timeout);
  }
  if (parsed.scheme == "file") {
    if (!parsed.host.empty() && parsed.host != "localhost") {
      throw Error{ErrorDomain::Transport, errors::transport::kUnsupportedScheme,
                  "file:// URIs must refer to the local host: " + std::string(uri)};
    }
    return std::make_unique<FileRemoteSource>(parsed.path);
  }
  throw Error{ErrorDomain::Transport, errors::transport::kUnsupportedScheme,
              "Unsupported URI scheme '" + parsed.scheme + "'"};
}

}  // namespace da::transport
