#include "da/staging/multipart.h"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "da/error.h"
#include "da/transport/byte_stream.h"
#include "test_support.h"

namespace {

// Flattens the callback sequence into strings for easy comparison.
class RecordingHandler final : public da::staging::MultipartHandler {
public:
  void StartContainer(std::string_view name) override { events.push_back("container:" + std::string(name)); }
  void EndContainer() override { events.push_back("end-container"); }
  void StartFile(std::string_view name, std::string_view content_type) override {
    events.push_back("file:" + std::string(name) + ":" + std::string(content_type));
    contents.emplace_back();
  }
  void WriteData(std::span<const uint8_t> data) override {
    contents.back().append(reinterpret_cast<const char*>(data.data()), data.size());
  }
  void EndFile() override { events.push_back("end-file"); }

  std::vector<std::string> events;
  std::vector<std::string> contents;
};

std::string NestedBody(const std::string& payload) {
  std::string body;
  body += "This preamble is ignored.\r\n";
  body += "--outer\r\n";
  body += "Content-Disposition: form-data; name=\"a\"; filename=\"f1.txt\"\r\n";
  body += "Content-Type: text/plain; charset=us-ascii\r\n";
  body += "\r\n";
  body += "hello\r\nworld";
  body += "\r\n--outer\r\n";
  body += "Content-Type: multipart/mixed; boundary=\"inner\"\r\n";
  body += "Content-Disposition: attachment; container_name=\"B\"\r\n";
  body += "\r\n";
  body += "--inner\r\n";
  body += "content-disposition: attachment; filename=\"dir/f2.bin\"\r\n";
  body += "\r\n";
  body += payload;
  body += "\r\n--inner--\r\n";
  body += "\r\n--outer--\r\n";
  body += "epilogue bytes";
  return body;
}

void TestNestedBody(size_t block_size) {
  const std::string payload = da::testing::Pattern(3000, 5);
  const std::string body = NestedBody(payload);
  da::transport::MemoryByteStream stream(body);
  RecordingHandler handler;
  da::staging::MultipartParser parser(stream, handler, block_size, body.size());
  parser.Parse("outer", "A");

  const std::vector<std::string> expected{"container:A", "file:f1.txt:text/plain", "end-file",
                                          "container:B", "file:f2.bin:",           "end-file",
                                          "end-container", "end-container"};
  assert(handler.events == expected);
  assert(handler.contents.size() == 2);
  assert(handler.contents[0] == "hello\r\nworld");
  assert(handler.contents[1] == payload);
  assert(parser.bytes_read() == body.size());
}

void TestUnnamedPartsAndBareDelimiters() {
  std::string body;
  body += "--b\n";
  body += "Content-Type: application/octet-stream\n";
  body += "\n";
  body += "one";
  body += "\r\n--b  \r\n";
  body += "\r\n";
  body += "two";
  body += "\r\n--b--";
  da::transport::MemoryByteStream stream(body);
  RecordingHandler handler;
  da::staging::MultipartParser parser(stream, handler, 4, body.size());
  parser.Parse("b", "root");
  assert(handler.events.size() == 6);
  assert(handler.events[1] == "file:file-1:application/octet-stream");
  assert(handler.events[3] == "file:file-2:");
  assert(handler.contents[0] == "one");
  assert(handler.contents[1] == "two");
}

int ParseFailure(const std::string& body, uint64_t max_bytes, std::string_view boundary = "b") {
  da::transport::MemoryByteStream stream(body);
  RecordingHandler handler;
  da::staging::MultipartParser parser(stream, handler, 16, max_bytes);
  try {
    parser.Parse(boundary, "root");
  } catch (const da::Error& err) {
    assert(err.domain == da::ErrorDomain::Validation);
    return err.code;
  }
  return 0;
}

void TestMalformedBodies() {
  using namespace da::errors::validation;
  const std::string part = "Content-Disposition: form-data; filename=\"x.txt\"\r\n\r\ndata\r\n";

  const std::string duplicate = "--b\r\n" + part + "--b\r\n" + part + "--b--\r\n";
  assert(ParseFailure(duplicate, duplicate.size()) == kDuplicatePartName);

  const std::string truncated = "--b\r\n" + part + "--b\r\nContent-Disposition: form-data; filename=\"y\"\r\n\r\nmore";
  assert(ParseFailure(truncated, truncated.size()) == kTruncatedBody);

  // A body cut short by the declared length is truncated even if more bytes follow.
  const std::string complete = "--b\r\n" + part + "--b--\r\n";
  assert(ParseFailure(complete, complete.size() - 8) == kTruncatedBody);

  const std::string long_header = "--b\r\nX-Padding: " + std::string(9000, 'p') + "\r\n\r\ndata\r\n--b--";
  assert(ParseFailure(long_header, long_header.size()) == kHeaderTooLong);

  const std::string bad_header = "--b\r\nnot a header\r\n\r\ndata\r\n--b--";
  assert(ParseFailure(bad_header, bad_header.size()) == kMalformedMultipart);

  const std::string no_boundary = "--b\r\nContent-Type: multipart/mixed\r\n\r\n--c--\r\n--b--";
  assert(ParseFailure(no_boundary, no_boundary.size()) == kMalformedMultipart);

  assert(ParseFailure(complete, complete.size(), "") == kMalformedMultipart);
  assert(ParseFailure(complete, complete.size(), std::string(71, 'b')) == kMalformedMultipart);
  assert(ParseFailure("no delimiter here", 17) == kTruncatedBody);
}

void TestHeaderHelpers() {
  const auto value = da::staging::ParseHeaderValue("Multipart/Mixed; Boundary=\"a;b\"; flag; name=plain");
  assert(value.value == "multipart/mixed");
  assert(value.Param("boundary") == std::optional<std::string>("a;b"));
  assert(value.Param("BOUNDARY") == std::optional<std::string>("a;b"));
  assert(value.Param("flag") == std::optional<std::string>(""));
  assert(value.Param("name") == std::optional<std::string>("plain"));
  assert(!value.Param("missing"));

  assert(da::staging::IsMultipart(" multipart/form-data; boundary=x"));
  assert(!da::staging::IsMultipart("application/octet-stream"));

  assert(da::staging::SanitizeName("../../etc/passwd") == "passwd");
  assert(da::staging::SanitizeName("C:\\data\\obs.fits") == "obs.fits");
  assert(da::staging::SanitizeName(" name\twith\x01 ctrl ") == "namewith ctrl");
  assert(da::staging::SanitizeName("..").empty());
  assert(da::staging::SanitizeName("dir/").empty());
}

}  // namespace

int main() {
  TestNestedBody(65536);
  TestNestedBody(7);
  TestUnnamedPartsAndBareDelimiters();
  TestMalformedBodies();
  TestHeaderHelpers();
  std::cout << "multipart tests passed" << std::endl;
  return 0;
}
