#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace da::transport {

// Finite, non-rewindable byte stream.
class ByteStream {
public:
  virtual ~ByteStream() = default;

  // Reads up to buffer.size() bytes. Returns 0 at end of stream; throws
  // da::Error on I/O failure.
  virtual size_t Read(std::span<uint8_t> buffer) = 0;

  // Length announced by the producer (e.g. Content-Length), if any.
  virtual std::optional<uint64_t> DeclaredLength() const { return std::nullopt; }

  // Case-insensitive protocol header lookup.
  virtual std::optional<std::string> Header(std::string_view name) const {
    (void)name;
    return std::nullopt;
  }
};

// Reads until the buffer is full or the stream ends. Returns bytes read.
size_t ReadFully(ByteStream& stream, std::span<uint8_t> buffer);

// Reads and drops exactly `count` bytes. Throws kShortRead if the stream
// ends first.
void Discard(ByteStream& stream, uint64_t count, size_t block_size);

class MemoryByteStream final : public ByteStream {
public:
  explicit MemoryByteStream(std::vector<uint8_t> data, std::optional<uint64_t> declared = std::nullopt);
  explicit MemoryByteStream(std::string_view data, std::optional<uint64_t> declared = std::nullopt);

  size_t Read(std::span<uint8_t> buffer) override;
  std::optional<uint64_t> DeclaredLength() const override { return declared_; }
  std::optional<std::string> Header(std::string_view name) const override;

  void SetHeader(std::string name, std::string value);

private:
  std::vector<uint8_t> data_;
  size_t position_{0};
  std::optional<uint64_t> declared_;
  std::map<std::string, std::string> headers_;
};

// Reads from a POSIX descriptor. Owns and closes it when `owns` is set.
class FdByteStream final : public ByteStream {
public:
  FdByteStream(int fd, bool owns, std::optional<uint64_t> declared = std::nullopt);
  ~FdByteStream() override;
  FdByteStream(const FdByteStream&) = delete;
  FdByteStream& operator=(const FdByteStream&) = delete;

  size_t Read(std::span<uint8_t> buffer) override;
  std::optional<uint64_t> DeclaredLength() const override { return declared_; }

private:
  int fd_;
  bool owns_;
  std::optional<uint64_t> declared_;
};

std::string ToLowerAscii(std::string_view text);

}  // namespace da::transport
