#include "da/transport/byte_stream.h"

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <unistd.h>

#include "da/error.h"

namespace da::transport {

std::string ToLowerAscii(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(c >= 'A' && c <= 'Z' ? c - 'A' + 'a' : c);
  });
  return out;
}

size_t ReadFully(ByteStream& stream, std::span<uint8_t> buffer) {
  size_t total = 0;
  while (total < buffer.size()) {
    const size_t got = stream.Read(buffer.subspan(total));
    if (got == 0) {
      break;
    }
    total += got;
  }
  return total;
}

void Discard(ByteStream& stream, uint64_t count, size_t block_size) {
  std::vector<uint8_t> scratch(std::max<size_t>(1, std::min<uint64_t>(block_size, count == 0 ? 1 : count)));
  uint64_t remaining = count;
  while (remaining > 0) {
    const size_t want = static_cast<size_t>(std::min<uint64_t>(remaining, scratch.size()));
    const size_t got = stream.Read(std::span<uint8_t>(scratch.data(), want));
    if (got == 0) {
      throw Error{ErrorDomain::IO, errors::io::kShortRead,
                  "Stream ended " + std::to_string(remaining) + " bytes before the requested offset"};
    }
    remaining -= got;
  }
}

MemoryByteStream::MemoryByteStream(std::vector<uint8_t> data, std::optional<uint64_t> declared)
    : data_(std::move(data)), declared_(declared) {}

MemoryByteStream::MemoryByteStream(std::string_view data, std::optional<uint64_t> declared)
    : data_(data.begin(), data.end()), declared_(declared) {}

size_t MemoryByteStream::Read(std::span<uint8_t> buffer) {
  const size_t count = std::min(buffer.size(), data_.size() - position_);
  std::memcpy(buffer.data(), data_.data() + position_, count);
  position_ += count;
  return count;
}

std::optional<std::string> MemoryByteStream::Header(std::string_view name) const {
  auto it = headers_.find(ToLowerAscii(name));
  if (it == headers_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void MemoryByteStream::SetHeader(std::string name, std::string value) {
  headers_[ToLowerAscii(name)] = std::move(value);
}

FdByteStream::FdByteStream(int fd, bool owns, std::optional<uint64_t> declared)
    : fd_(fd), owns_(owns), declared_(declared) {}

FdByteStream::~FdByteStream() {
  if (owns_ && fd_ >= 0) {
    ::close(fd_);
  }
}

size_t FdByteStream::Read(std::span<uint8_t> buffer) {
  for (;;) {
    const ssize_t got = ::read(fd_, buffer.data(), buffer.size());
    if (got >= 0) {
      return static_cast<size_t>(got);
    }
    const int saved_errno = errno;
    if (saved_errno == EINTR) {
      continue;
    }
    throw Error{ErrorDomain::IO, saved_errno, std::string("read failed: ") + std::strerror(saved_errno),
                saved_errno};
  }
}

}  // namespace da::transport
