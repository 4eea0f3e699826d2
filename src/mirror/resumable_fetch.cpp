#include "da/mirror/resumable_fetch.h"

#include <array>
#include <cerrno>
#include <cstring>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "da/common.h"
#include "da/storage/file_ops.h"

namespace da::mirror {
namespace {

using SteadyClock = std::chrono::steady_clock;

constexpr std::string_view kNoSpaceMarker = "No space left on device";

class FdGuard {
public:
  explicit FdGuard(int fd = -1) noexcept : fd_(fd) {}
  ~FdGuard() { Reset(); }
  FdGuard(const FdGuard&) = delete;
  FdGuard& operator=(const FdGuard&) = delete;

  int get() const noexcept { return fd_; }
  int release() noexcept {
    const int fd = fd_;
    fd_ = -1;
    return fd;
  }
  void Reset() noexcept {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

private:
  int fd_;
};

[[noreturn]] void ThrowErrno(std::string message, int err, int code = -1) {
  throw Error{ErrorDomain::IO, code < 0 ? err : code, message + ": " + std::strerror(err), err,
              storage::ClassifyNativeError(err)};
}

uint64_t FileSizeOrZero(const std::filesystem::path& path) {
  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  return ec ? 0 : static_cast<uint64_t>(size);
}

// rsync takes local paths and remote specs verbatim; file:// is unwrapped.
std::string RsyncSourceArgument(const std::string& uri) {
  constexpr std::string_view kFileScheme = "file://";
  if (transport::ToLowerAscii(std::string_view(uri).substr(0, kFileScheme.size())) == kFileScheme) {
    return transport::ParseUri(uri).path;
  }
  return uri;
}

}  // namespace

std::optional<FetchMethod> ParseFetchMethod(std::string_view name) noexcept {
  if (name == "HTTP" || name == "http") {
    return FetchMethod::kHttp;
  }
  if (name == "RSYNC" || name == "rsync") {
    return FetchMethod::kRsync;
  }
  return std::nullopt;
}

std::string_view FetchMethodName(FetchMethod method) noexcept {
  return method == FetchMethod::kRsync ? "RSYNC" : "HTTP";
}

StreamFetch::StreamFetch(SourceFactory factory, size_t block_size, checksum::Algorithm algorithm)
    : factory_(std::move(factory)), block_size_(block_size == 0 ? 65536 : block_size), algorithm_(algorithm) {}

FetchResult StreamFetch::Fetch(const FetchRequest& request, FetchProgress& progress) {
  const auto start = SteadyClock::now();
  checksum::Accumulator accumulator(algorithm_);
  if (request.start_byte > 0) {
    checksum::FeedFile(accumulator, request.staging_path, request.start_byte, block_size_);
  }

  auto source = factory_(request.uri);
  auto opened = source->Open(request.start_byte);
  if (opened.start_offset > request.start_byte) {
    throw Error{ErrorDomain::Transport, errors::transport::kProtocolError,
                source->Describe() + " resumed at " + std::to_string(opened.start_offset) + " instead of " +
                    std::to_string(request.start_byte),
                std::nullopt, Retryability::kTransient};
  }
  if (opened.start_offset < request.start_byte) {
    transport::Discard(*opened.stream, request.start_byte - opened.start_offset, block_size_);
  }

  const int flags = O_WRONLY | O_CREAT | O_CLOEXEC | (request.start_byte > 0 ? O_APPEND : O_TRUNC);
  FdGuard out(::open(request.staging_path.c_str(), flags, 0644));
  if (out.get() < 0) {
    ThrowErrno("Failed to open staging file " + PathToUtf8String(request.staging_path), errno,
               errors::io::kStagingWriteFailed);
  }

  std::vector<uint8_t> block(block_size_);
  for (;;) {
    const size_t got = opened.stream->Read(block);
    if (got == 0) {
      break;
    }
    const std::span<const uint8_t> data(block.data(), got);
    storage::WriteAll(out.get(), data);
    accumulator.Update(data);
    progress.bytes_received += got;
  }
  storage::SyncFile(out.get());
  if (::close(out.release()) != 0) {
    ThrowErrno("Failed to close staging file " + PathToUtf8String(request.staging_path), errno);
  }

  FetchResult result;
  result.bytes_received = progress.bytes_received;
  result.file_size = request.start_byte + progress.bytes_received;
  result.algorithm = algorithm_;
  result.checksum = accumulator.Finalize();
  result.io_seconds = SecondsSince(start);
  return result;
}

RsyncFetch::RsyncFetch(std::string rsync_binary, size_t block_size, checksum::Algorithm algorithm)
    : rsync_binary_(std::move(rsync_binary)), block_size_(block_size == 0 ? 65536 : block_size),
      algorithm_(algorithm) {}

FetchResult RsyncFetch::Fetch(const FetchRequest& request, FetchProgress& progress) {
  const auto start = SteadyClock::now();
  const std::string source = RsyncSourceArgument(request.uri);
  const std::string target = PathToUtf8String(request.staging_path);

  int pipe_fds[2];
  if (::pipe2(pipe_fds, O_CLOEXEC) != 0) {
    ThrowErrno("Failed to create rsync stderr pipe", errno, errors::io::kProcessFailed);
  }
  FdGuard read_end(pipe_fds[0]);
  FdGuard write_end(pipe_fds[1]);

  std::vector<std::string> args{rsync_binary_, "--append", "--inplace", source, target};
  std::vector<char*> argv;
  for (auto& arg : args) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);

  pid_t pid = ::fork();
  if (pid < 0) {
    ThrowErrno("Failed to fork " + rsync_binary_, errno, errors::io::kProcessFailed);
  }
  if (pid == 0) {
    ::dup2(write_end.get(), STDERR_FILENO);
    int null_fd = ::open("/dev/null", O_WRONLY);
    if (null_fd >= 0) {
      ::dup2(null_fd, STDOUT_FILENO);
    }
    ::execvp(argv[0], argv.data());
    const char kExecFailed[] = "exec of rsync failed\n";
    (void)!::write(STDERR_FILENO, kExecFailed, sizeof(kExecFailed) - 1);
    ::_exit(127);
  }
  write_end.Reset();

  std::string stderr_output;
  std::array<char, 4096> buffer{};
  for (;;) {
    const ssize_t got = ::read(read_end.get(), buffer.data(), buffer.size());
    if (got > 0) {
      stderr_output.append(buffer.data(), static_cast<size_t>(got));
      continue;
    }
    if (got < 0 && errno == EINTR) {
      continue;
    }
    break;
  }

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      ThrowErrno("Failed to wait for " + rsync_binary_, errno, errors::io::kProcessFailed);
    }
  }

  const uint64_t size = FileSizeOrZero(request.staging_path);
  progress.bytes_received = size > request.start_byte ? size - request.start_byte : 0;
  CheckRsyncExit(status, stderr_output);

  FetchResult result;
  result.bytes_received = progress.bytes_received;
  result.file_size = size;
  result.algorithm = algorithm_;
  result.checksum = checksum::ChecksumFile(request.staging_path, algorithm_, block_size_);
  result.io_seconds = SecondsSince(start);
  return result;
}

void CheckRsyncExit(int wait_status, std::string_view stderr_output) {
  if (WIFEXITED(wait_status) && WEXITSTATUS(wait_status) == 0) {
    return;
  }
  std::string message = "rsync ";
  if (WIFEXITED(wait_status)) {
    message += "exited with status " + std::to_string(WEXITSTATUS(wait_status));
  } else if (WIFSIGNALED(wait_status)) {
    message += "killed by signal " + std::to_string(WTERMSIG(wait_status));
  } else {
    message += "failed";
  }
  if (!stderr_output.empty()) {
    message += ": " + std::string(stderr_output.substr(0, 512));
  }
  if (stderr_output.find(kNoSpaceMarker) != std::string_view::npos) {
    throw Error{ErrorDomain::IO, errors::io::kProcessFailed, message, ENOSPC, Retryability::kFatal};
  }
  throw Error{ErrorDomain::IO, errors::io::kProcessFailed, message, std::nullopt, Retryability::kTransient};
}

std::string_view FetchOutcomeName(FetchOutcome outcome) noexcept {
  switch (outcome) {
  case FetchOutcome::kDiskExhausted:
    return "disk_exhausted";
  case FetchOutcome::kResumable:
    return "resumable";
  case FetchOutcome::kIoFailure:
    return "io_failure";
  }
  return "io_failure";
}

FetchOutcome ClassifyFetchFailure(const Error& error, uint64_t bytes_this_attempt, uint64_t start_byte) noexcept {
  if (error.native_code && *error.native_code == ENOSPC) {
    return FetchOutcome::kDiskExhausted;
  }
  if (bytes_this_attempt > 0 || start_byte > 0) {
    return FetchOutcome::kResumable;
  }
  return FetchOutcome::kIoFailure;
}

std::unique_ptr<FetchStrategy> MakeFetchStrategy(FetchMethod method, size_t block_size,
                                                 checksum::Algorithm algorithm, const std::string& rsync_binary,
                                                 std::chrono::seconds http_timeout) {
  if (method == FetchMethod::kRsync) {
    return std::make_unique<RsyncFetch>(rsync_binary, block_size, algorithm);
  }
  return std::make_unique<StreamFetch>(
      [http_timeout](std::string_view uri) { return transport::MakeRemoteSource(uri, http_timeout); }, block_size,
      algorithm);
}

}  // namespace da::mirror
