#include "da/staging/multipart.h"

#include <algorithm>
#include <cstring>

#include "da/error.h"

namespace da::staging {
namespace {

// RFC 2046 limits boundaries to 70 characters.
constexpr size_t kMaxBoundaryLength = 70;

std::string_view TrimWhitespace(std::string_view text) {
  while (!text.empty() && (text.front() == ' ' || text.front() == '\t' || text.front() == '\r' ||
                           text.front() == '\n')) {
    text.remove_prefix(1);
  }
  while (!text.empty() && (text.back() == ' ' || text.back() == '\t' || text.back() == '\r' ||
                           text.back() == '\n')) {
    text.remove_suffix(1);
  }
  return text;
}

std::vector<std::string_view> SplitParameters(std::string_view text) {
  std::vector<std::string_view> parts;
  bool quoted = false;
  size_t start = 0;
  for (size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (c == '\\' && quoted) {
      ++i;
      continue;
    }
    if (c == '"') {
      quoted = !quoted;
    } else if (c == ';' && !quoted) {
      parts.push_back(text.substr(start, i - start));
      start = i + 1;
    }
  }
  parts.push_back(text.substr(start));
  return parts;
}

std::string Unquote(std::string_view text) {
  if (text.size() < 2 || text.front() != '"' || text.back() != '"') {
    return std::string(text);
  }
  std::string out;
  text = text.substr(1, text.size() - 2);
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\\' && i + 1 < text.size()) {
      ++i;
    }
    out.push_back(text[i]);
  }
  return out;
}

struct DiscardSink {
  void operator()(std::span<const uint8_t>) const noexcept {}
};

}  // namespace

std::optional<std::string> HeaderValue::Param(std::string_view key) const {
  auto it = params.find(transport::ToLowerAscii(key));
  if (it == params.end()) {
    return std::nullopt;
  }
  return it->second;
}

HeaderValue ParseHeaderValue(std::string_view text) {
  HeaderValue parsed;
  auto parts = SplitParameters(text);
  parsed.value = transport::ToLowerAscii(TrimWhitespace(parts.front()));
  for (size_t i = 1; i < parts.size(); ++i) {
    auto part = TrimWhitespace(parts[i]);
    if (part.empty()) {
      continue;
    }
    const auto eq = part.find('=');
    if (eq == std::string_view::npos) {
      parsed.params[transport::ToLowerAscii(part)] = "";
      continue;
    }
    parsed.params[transport::ToLowerAscii(TrimWhitespace(part.substr(0, eq)))] =
        Unquote(TrimWhitespace(part.substr(eq + 1)));
  }
  return parsed;
}

bool IsMultipart(std::string_view content_type) {
  return transport::ToLowerAscii(TrimWhitespace(content_type)).starts_with("multipart/");
}

std::string SanitizeName(std::string_view name) {
  const auto slash = name.find_last_of("/\\");
  if (slash != std::string_view::npos) {
    name = name.substr(slash + 1);
  }
  std::string out;
  out.reserve(name.size());
  for (unsigned char c : name) {
    if (c >= 0x20 && c != 0x7F) {
      out.push_back(static_cast<char>(c));
    }
  }
  std::string trimmed(TrimWhitespace(out));
  if (trimmed == "." || trimmed == "..") {
    return {};
  }
  return trimmed;
}

MultipartParser::MultipartParser(transport::ByteStream& stream, MultipartHandler& handler, size_t block_size,
                                 uint64_t max_bytes)
    : stream_(stream), handler_(handler), block_size_(block_size == 0 ? 65536 : block_size),
      max_bytes_(max_bytes) {}

void MultipartParser::Parse(std::string_view boundary, std::string_view root_name) {
  if (boundary.empty() || boundary.size() > kMaxBoundaryLength) {
    Fail(errors::validation::kMalformedMultipart, "missing or oversized multipart boundary");
  }
  ParseLevel(std::string(boundary), root_name, true);
}

void MultipartParser::Fail(int code, const std::string& message) const {
  throw Error{ErrorDomain::Validation, code,
              "Malformed multipart body: " + message + " (after " + std::to_string(bytes_read_) + " bytes)"};
}

bool MultipartParser::Fill() {
  if (eof_) {
    return false;
  }
  if (begin_ > 0) {
    std::memmove(buffer_.data(), buffer_.data() + begin_, end_ - begin_);
    end_ -= begin_;
    begin_ = 0;
  }
  const uint64_t budget = max_bytes_ - bytes_read_;
  if (budget == 0) {
    eof_ = true;
    return false;
  }
  const size_t want = static_cast<size_t>(std::min<uint64_t>(block_size_, budget));
  if (buffer_.size() < end_ + want) {
    buffer_.resize(end_ + want);
  }
  const size_t got = stream_.Read(std::span<uint8_t>(buffer_.data() + end_, want));
  if (got == 0) {
    eof_ = true;
    return false;
  }
  end_ += got;
  bytes_read_ += got;
  return true;
}

bool MultipartParser::Ensure(size_t count) {
  while (Available() < count) {
    if (!Fill()) {
      return false;
    }
  }
  return true;
}

bool MultipartParser::StartsWith(std::string_view text) const {
  return Available() >= text.size() && std::memcmp(buffer_.data() + begin_, text.data(), text.size()) == 0;
}

template <typename Sink>
void MultipartParser::ScanUntil(std::string_view pattern, Sink&& sink) {
  for (;;) {
    const uint8_t* first = buffer_.data() + begin_;
    const uint8_t* last = buffer_.data() + end_;
    const uint8_t* hit = std::search(first, last, pattern.begin(), pattern.end(),
                                     [](uint8_t a, char b) { return a == static_cast<uint8_t>(b); });
    if (hit != last) {
      const size_t count = static_cast<size_t>(hit - first);
      if (count > 0) {
        sink(std::span<const uint8_t>(first, count));
      }
      Consume(count + pattern.size());
      return;
    }
    // Hold back a possible partial match at the end of the buffer.
    const size_t keep = std::min(Available(), pattern.size() - 1);
    const size_t emit = Available() - keep;
    if (emit > 0) {
      sink(std::span<const uint8_t>(first, emit));
      Consume(emit);
    }
    if (!Fill()) {
      Fail(errors::validation::kTruncatedBody, "body ended before the closing delimiter");
    }
  }
}

std::string MultipartParser::ReadLine() {
  std::string line;
  for (;;) {
    const uint8_t* first = buffer_.data() + begin_;
    const uint8_t* last = buffer_.data() + end_;
    const uint8_t* newline = std::find(first, last, static_cast<uint8_t>('\n'));
    line.append(reinterpret_cast<const char*>(first), static_cast<size_t>(newline - first));
    if (line.size() > kMaxHeaderLine) {
      Fail(errors::validation::kHeaderTooLong, "part header line exceeds " + std::to_string(kMaxHeaderLine) + " bytes");
    }
    if (newline != last) {
      Consume(static_cast<size_t>(newline - first) + 1);
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      return line;
    }
    Consume(Available());
    if (!Fill()) {
      Fail(errors::validation::kTruncatedBody, "body ended inside part headers");
    }
  }
}

MultipartParser::Headers MultipartParser::ReadHeaders() {
  Headers headers;
  for (;;) {
    std::string line = ReadLine();
    if (line.empty()) {
      return headers;
    }
    const auto colon = line.find(':');
    if (colon == std::string::npos || colon == 0) {
      Fail(errors::validation::kMalformedMultipart, "invalid part header line");
    }
    std::string_view view(line);
    headers[transport::ToLowerAscii(TrimWhitespace(view.substr(0, colon)))] =
        std::string(TrimWhitespace(view.substr(colon + 1)));
  }
}

void MultipartParser::ConsumeDelimiterTail(bool& closing) {
  if (!Ensure(2)) {
    Fail(errors::validation::kTruncatedBody, "body ended after a delimiter");
  }
  if (StartsWith("--")) {
    Consume(2);
    closing = true;
    return;
  }
  while (Ensure(1) && (StartsWith(" ") || StartsWith("\t"))) {
    Consume(1);
  }
  if (Ensure(2) && StartsWith("\r\n")) {
    Consume(2);
  } else if (Ensure(1) && StartsWith("\n")) {
    Consume(1);
  } else {
    Fail(errors::validation::kMalformedMultipart, "delimiter line not terminated");
  }
  closing = false;
}

void MultipartParser::ParseFilePart(const Headers& headers, const std::string& separator,
                                    std::vector<std::string>& names) {
  std::string content_type;
  if (auto it = headers.find("content-type"); it != headers.end()) {
    content_type = ParseHeaderValue(it->second).value;
  }
  std::string name;
  if (auto it = headers.find("content-disposition"); it != headers.end()) {
    name = SanitizeName(ParseHeaderValue(it->second).Param("filename").value_or(""));
  }
  if (name.empty()) {
    name = "file-" + std::to_string(++file_counter_);
  }
  if (std::find(names.begin(), names.end(), name) != names.end()) {
    Fail(errors::validation::kDuplicatePartName, "duplicate part name '" + name + "'");
  }
  names.push_back(name);

  handler_.StartFile(name, content_type);
  ScanUntil(separator, [this](std::span<const uint8_t> data) { handler_.WriteData(data); });
  handler_.EndFile();
}

void MultipartParser::ParseLevel(const std::string& boundary, std::string_view name, bool root) {
  handler_.StartContainer(name);
  const std::string delimiter = "--" + boundary;
  const std::string separator = "\r\n" + delimiter;

  // The first delimiter may open the body without a preceding CRLF.
  if (Ensure(delimiter.size()) && StartsWith(delimiter)) {
    Consume(delimiter.size());
  } else {
    ScanUntil(separator, DiscardSink{});
  }

  std::vector<std::string> names;
  bool closing = false;
  ConsumeDelimiterTail(closing);
  while (!closing) {
    Headers headers = ReadHeaders();
    HeaderValue content_type;
    if (auto it = headers.find("content-type"); it != headers.end()) {
      content_type = ParseHeaderValue(it->second);
    }
    if (IsMultipart(content_type.value)) {
      auto nested = content_type.Param("boundary");
      if (!nested || nested->empty() || nested->size() > kMaxBoundaryLength) {
        Fail(errors::validation::kMalformedMultipart, "nested multipart part without a usable boundary");
      }
      std::string child;
      if (auto it = headers.find("content-disposition"); it != headers.end()) {
        child = SanitizeName(ParseHeaderValue(it->second).Param("container_name").value_or(""));
      }
      if (child.empty()) {
        child = "container-" + std::to_string(++container_counter_);
      }
      if (std::find(names.begin(), names.end(), child) != names.end()) {
        Fail(errors::validation::kDuplicatePartName, "duplicate part name '" + child + "'");
      }
      names.push_back(child);
      ParseLevel(*nested, child, false);
      // Skip the nested epilogue up to our own next delimiter.
      ScanUntil(separator, DiscardSink{});
    } else {
      ParseFilePart(headers, separator, names);
    }
    ConsumeDelimiterTail(closing);
  }

  if (root) {
    // Epilogue is ignored but still read so the byte count covers the body.
    Consume(Available());
    while (Fill()) {
      Consume(Available());
    }
  }
  handler_.EndContainer();
}

}  // namespace da::staging
