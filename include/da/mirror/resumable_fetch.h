#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "da/checksum/checksum.h"
#include "da/error.h"
#include "da/transport/remote_source.h"

namespace da::mirror {

enum class FetchMethod { kHttp, kRsync };

std::optional<FetchMethod> ParseFetchMethod(std::string_view name) noexcept;
std::string_view FetchMethodName(FetchMethod method) noexcept;

struct FetchRequest {
  std::string uri;
  std::filesystem::path staging_path;
  // Must equal the current size of staging_path (0 when absent).
  uint64_t start_byte{0};
};

// Updated while a fetch runs so the caller can classify a failure.
struct FetchProgress {
  uint64_t bytes_received{0};
};

struct FetchResult {
  double io_seconds{0.0};
  uint64_t bytes_received{0};
  uint64_t file_size{0};
  // Covers the whole staging file, bytes from earlier attempts included.
  std::string checksum;
  checksum::Algorithm algorithm{checksum::Algorithm::kCrc32};
};

class FetchStrategy {
public:
  virtual ~FetchStrategy() = default;
  // Throws da::Error on failure; `progress` reflects what this attempt
  // received up to that point.
  virtual FetchResult Fetch(const FetchRequest& request, FetchProgress& progress) = 0;
  virtual FetchMethod method() const noexcept = 0;
};

using SourceFactory = std::function<std::unique_ptr<transport::RemoteSource>(std::string_view uri)>;

// Pulls the source through a transport::RemoteSource, appending to the
// staging file. A source that starts before the requested offset has the
// gap read and dropped.
class StreamFetch final : public FetchStrategy {
public:
  StreamFetch(SourceFactory factory, size_t block_size, checksum::Algorithm algorithm);

  FetchResult Fetch(const FetchRequest& request, FetchProgress& progress) override;
  FetchMethod method() const noexcept override { return FetchMethod::kHttp; }

private:
  SourceFactory factory_;
  size_t block_size_;
  checksum::Algorithm algorithm_;
};

// Runs `rsync --append --inplace <source> <staging file>`.
class RsyncFetch final : public FetchStrategy {
public:
  RsyncFetch(std::string rsync_binary, size_t block_size, checksum::Algorithm algorithm);

  FetchResult Fetch(const FetchRequest& request, FetchProgress& progress) override;
  FetchMethod method() const noexcept override { return FetchMethod::kRsync; }

private:
  std::string rsync_binary_;
  size_t block_size_;
  checksum::Algorithm algorithm_;
};

// Throws Error{IO, kProcessFailed} for a non-zero exit. Output reporting a
// full disk carries native_code ENOSPC.
void CheckRsyncExit(int wait_status, std::string_view stderr_output);

enum class FetchOutcome { kDiskExhausted, kResumable, kIoFailure };

std::string_view FetchOutcomeName(FetchOutcome outcome) noexcept;

// Out-of-space wins over everything; otherwise any byte on disk, from this
// attempt or an earlier one, makes the transfer resumable.
FetchOutcome ClassifyFetchFailure(const Error& error, uint64_t bytes_this_attempt, uint64_t start_byte) noexcept;

std::unique_ptr<FetchStrategy> MakeFetchStrategy(FetchMethod method, size_t block_size,
                                                 checksum::Algorithm algorithm, const std::string& rsync_binary,
                                                 std::chrono::seconds http_timeout);

}  // namespace da::mirror
