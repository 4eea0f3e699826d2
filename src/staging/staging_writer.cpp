#include "da/staging/staging_writer.h"

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

#include "da/error.h"
#include "da/staging/multipart.h"
#include "da/storage/file_ops.h"

namespace da::staging {
namespace {

using SteadyClock = std::chrono::steady_clock;

// Accumulates the time spent blocked in the underlying stream.
class TimedByteStream final : public transport::ByteStream {
public:
  explicit TimedByteStream(transport::ByteStream& inner) : inner_(inner) {}

  size_t Read(std::span<uint8_t> buffer) override {
    const auto start = SteadyClock::now();
    const size_t got = inner_.Read(buffer);
    seconds_ += SecondsSince(start);
    return got;
  }
  std::optional<uint64_t> DeclaredLength() const override { return inner_.DeclaredLength(); }
  std::optional<std::string> Header(std::string_view name) const override { return inner_.Header(name); }

  double seconds() const noexcept { return seconds_; }

private:
  transport::ByteStream& inner_;
  double seconds_{0.0};
};

// Writes each leaf part to its own file below the staging directory and
// mirrors the container structure into the tree.
class FilesystemWriterHandler final : public MultipartHandler {
public:
  FilesystemWriterHandler(std::filesystem::path staging_dir, checksum::Algorithm algorithm,
                          StagingResult& result)
      : staging_dir_(std::move(staging_dir)), algorithm_(algorithm), result_(result) {}

  ~FilesystemWriterHandler() override {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }

  FilesystemWriterHandler(const FilesystemWriterHandler&) = delete;
  FilesystemWriterHandler& operator=(const FilesystemWriterHandler&) = delete;

  void StartContainer(std::string_view name) override {
    auto& tree = result_.tree;
    const size_t index =
        stack_.empty() ? tree.AddRoot(std::string(name)) : tree.AddChild(stack_.back(), std::string(name));
    stack_.push_back(index);
    const auto dir = staging_dir_ / tree.PathOf(index);
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
      throw Error{ErrorDomain::IO, errors::io::kStagingWriteFailed,
                  "Failed to create staging directory " + PathToUtf8String(dir) + ": " + ec.message(),
                  ec.value(), storage::ClassifyNativeError(ec.value())};
    }
  }

  void EndContainer() override {
    if (!stack_.empty()) {
      stack_.pop_back();
    }
  }

  void StartFile(std::string_view name, std::string_view content_type) override {
    if (stack_.empty() || fd_ >= 0) {
      throw Error{ErrorDomain::Internal, 0, "File part outside of a container"};
    }
    current_ = StagedFile{};
    current_.container = stack_.back();
    current_.name = std::string(name);
    current_.content_type = std::string(content_type);
    current_.algorithm = algorithm_;
    current_.path = staging_dir_ / result_.tree.PathOf(current_.container) / current_.name;

    fd_ = ::open(current_.path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd_ < 0) {
      const int err = errno;
      throw Error{ErrorDomain::IO, errors::io::kStagingWriteFailed,
                  "Failed to create staging file " + PathToUtf8String(current_.path) + ": " + std::strerror(err),
                  err, storage::ClassifyNativeError(err)};
    }
    accumulator_.emplace(algorithm_);
  }

  void WriteData(std::span<const uint8_t> data) override {
    auto start = SteadyClock::now();
    accumulator_->Update(data);
    result_.checksum_seconds += SecondsSince(start);

    start = SteadyClock::now();
    storage::WriteAll(fd_, data);
    result_.writing_seconds += SecondsSince(start);
    current_.size += data.size();
  }

  void EndFile() override {
    const auto start = SteadyClock::now();
    storage::SyncFile(fd_);
    const int fd = fd_;
    fd_ = -1;
    if (::close(fd) != 0) {
      const int err = errno;
      throw Error{ErrorDomain::IO, err, "close failed for " + PathToUtf8String(current_.path), err,
                  storage::ClassifyNativeError(err)};
    }
    result_.writing_seconds += SecondsSince(start);
    current_.checksum = accumulator_->Finalize();
    accumulator_.reset();
    result_.files.push_back(std::move(current_));
  }

private:
  std::filesystem::path staging_dir_;
  checksum::Algorithm algorithm_;
  StagingResult& result_;
  std::vector<size_t> stack_;
  StagedFile current_;
  std::optional<checksum::Accumulator> accumulator_;
  int fd_{-1};
};

struct MimeByExtension {
  std::string_view extension;
  std::string_view mime_type;
};

// Longest extensions first so ".fits.gz" wins over ".gz".
constexpr std::array<MimeByExtension, 14> kMimeTable{{
    {".fits.gz", "application/x-gfits"},
    {".fits.z", "application/x-cfits"},
    {".fits", "image/x-fits"},
    {".hfits", "application/x-hfits"},
    {".tar.gz", "application/x-gtar"},
    {".tar", "application/x-tar"},
    {".gz", "application/gzip"},
    {".zip", "application/zip"},
    {".xml", "text/xml"},
    {".json", "application/json"},
    {".txt", "text/plain"},
    {".log", "text/plain"},
    {".html", "text/html"},
    {".png", "image/png"},
}};

}  // namespace

StagingWriter::StagingWriter(size_t block_size, checksum::Algorithm algorithm)
    : block_size_(block_size == 0 ? 65536 : block_size), algorithm_(algorithm) {}

StagingResult StagingWriter::Stage(transport::ByteStream& body, const StagingRequest& request,
                                   const std::filesystem::path& staging_dir) const {
  const auto start = SteadyClock::now();
  StagingResult result;
  result.staging_dir = staging_dir;
  try {
    std::error_code ec;
    std::filesystem::create_directories(staging_dir, ec);
    if (ec) {
      throw Error{ErrorDomain::IO, errors::io::kStagingWriteFailed,
                  "Failed to create staging area " + PathToUtf8String(staging_dir) + ": " + ec.message(),
                  ec.value(), storage::ClassifyNativeError(ec.value())};
    }

    TimedByteStream timed(body);
    const HeaderValue content_type = ParseHeaderValue(request.content_type);
    if (IsMultipart(content_type.value)) {
      const auto boundary = content_type.Param("boundary");
      if (!boundary || boundary->empty()) {
        throw Error{ErrorDomain::Validation, errors::validation::kMalformedMultipart,
                    "Multipart request without boundary parameter"};
      }
      StageMultipart(timed, request, *boundary, result);
    } else {
      StageSingle(timed, request, result);
    }
    result.reading_seconds = timed.seconds();
  } catch (...) {
    storage::RemovePathNoThrow(staging_dir);
    throw;
  }

  result.elapsed_seconds = SecondsSince(start);
  result.ingest_rate =
      result.elapsed_seconds > 0.0 ? static_cast<double>(result.bytes_read) / result.elapsed_seconds : 0.0;
  return result;
}

void StagingWriter::StageSingle(transport::ByteStream& body, const StagingRequest& request,
                                StagingResult& result) const {
  std::string root_name = SanitizeName(request.root_name);
  if (root_name.empty()) {
    root_name = "root";
  }
  std::string file_name = SanitizeName(request.file_name);
  if (file_name.empty()) {
    file_name = "file-1";
  }

  FilesystemWriterHandler handler(result.staging_dir, algorithm_, result);
  handler.StartContainer(root_name);
  handler.StartFile(file_name, ParseHeaderValue(request.content_type).value);

  std::vector<uint8_t> block(block_size_);
  uint64_t remaining = request.expected_size;
  while (remaining > 0) {
    const size_t want = static_cast<size_t>(std::min<uint64_t>(block.size(), remaining));
    const size_t got = body.Read(std::span<uint8_t>(block.data(), want));
    if (got == 0) {
      break;
    }
    handler.WriteData(std::span<const uint8_t>(block.data(), got));
    result.bytes_read += got;
    remaining -= got;
  }
  if (request.expected_size != kUnknownSize && result.bytes_read < request.expected_size) {
    throw Error{ErrorDomain::IO, errors::io::kShortRead,
                "Request body ended after " + std::to_string(result.bytes_read) + " of " +
                    std::to_string(request.expected_size) + " bytes"};
  }

  handler.EndFile();
  handler.EndContainer();
}

void StagingWriter::StageMultipart(transport::ByteStream& body, const StagingRequest& request,
                                   std::string_view boundary, StagingResult& result) const {
  std::string root_name = SanitizeName(request.root_name);
  if (root_name.empty()) {
    root_name = "root";
  }
  FilesystemWriterHandler handler(result.staging_dir, algorithm_, result);
  MultipartParser parser(body, handler, block_size_, request.expected_size);
  parser.Parse(boundary, root_name);
  result.bytes_read = parser.bytes_read();
}

uint64_t EstimateTransferSize(std::string_view uri, const transport::ByteStream& stream,
                              std::optional<uint64_t> declared_size) {
  const std::string lowered = transport::ToLowerAscii(uri);
  if (lowered.starts_with("http://")) {
    if (auto length = stream.DeclaredLength()) {
      return *length;
    }
    return kUnknownSize;
  }
  if (lowered.find("://") != std::string::npos) {
    return kUnknownSize;
  }
  return declared_size.value_or(kUnknownSize);
}

std::string GuessMimeType(std::string_view file_name) {
  const std::string lowered = transport::ToLowerAscii(file_name);
  for (const auto& entry : kMimeTable) {
    if (lowered.ends_with(entry.extension)) {
      return std::string(entry.mime_type);
    }
  }
  return "application/octet-stream";
}

}  // namespace da::staging
