#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "da/transport/byte_stream.h"

namespace da::staging {

// Receives the structure of a nested multipart body as it streams past.
// Calls are strictly nested: StartContainer/EndContainer bracket each
// multipart level and StartFile/EndFile bracket the WriteData calls of one
// leaf part.
class MultipartHandler {
public:
  virtual ~MultipartHandler() = default;
  virtual void StartContainer(std::string_view name) = 0;
  virtual void EndContainer() = 0;
  virtual void StartFile(std::string_view name, std::string_view content_type) = 0;
  virtual void WriteData(std::span<const uint8_t> data) = 0;
  virtual void EndFile() = 0;
};

// "type/subtype; key=value; key=\"quoted\"" split into a lower-case type and
// parameters with lower-case keys and unquoted values.
struct HeaderValue {
  std::string value;
  std::map<std::string, std::string> params;

  std::optional<std::string> Param(std::string_view key) const;
};

HeaderValue ParseHeaderValue(std::string_view text);

bool IsMultipart(std::string_view content_type);

// Reduces a client-supplied name to one safe path component. Returns an
// empty string when nothing usable remains.
std::string SanitizeName(std::string_view name);

class MultipartParser {
public:
  static constexpr size_t kMaxHeaderLine = 8 * 1024;

  // Reads at most `max_bytes` from `stream`, in pieces of `block_size`.
  MultipartParser(transport::ByteStream& stream, MultipartHandler& handler, size_t block_size,
                  uint64_t max_bytes);

  // Parses a complete body delimited by `boundary` and reports it as a root
  // container called `root_name`. Throws Error{Validation} on malformed input.
  void Parse(std::string_view boundary, std::string_view root_name);

  uint64_t bytes_read() const noexcept { return bytes_read_; }

private:
  using Headers = std::map<std::string, std::string>;

  void ParseLevel(const std::string& boundary, std::string_view name, bool root);
  void ParseFilePart(const Headers& headers, const std::string& delimiter, std::vector<std::string>& names);

  bool Fill();
  bool Ensure(size_t count);
  size_t Available() const noexcept { return end_ - begin_; }
  bool StartsWith(std::string_view text) const;
  void Consume(size_t count) { begin_ += count; }

  // Streams everything before `pattern` to `sink` and consumes the pattern. Throws kTruncatedBody at end of stream.
  template <typename Sink>
  void ScanUntil(std::string_view pattern, Sink&& sink);

  std::string ReadLine();
  Headers ReadHeaders();
  void ConsumeDelimiterTail(bool& closing);

  [[noreturn]] void Fail(int code, const std::string& message) const;

  transport::ByteStream& stream_;
  MultipartHandler& handler_;
  size_t block_size_;
  uint64_t max_bytes_;
  uint64_t bytes_read_{0};
  std::vector<uint8_t> buffer_;
  size_t begin_{0};
  size_t end_{0};
  bool eof_{false};
  unsigned container_counter_{0};
  unsigned file_counter_{0};
};

}  // namespace da::staging
