#include "da/storage/file_ops.h"

#include <openssl/rand.h>

#include <array>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <type_traits>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/types.h>
#include <unistd.h>

#include "da/common.h"

namespace da::storage {
namespace {

constexpr const char* kMoveErrorMessage = "Failed to move staged file";
constexpr size_t kCopyBufferSize = 1 << 20;

class ErrorContext {
 public:
  void Push(std::string context) { context_stack_.push_back(std::move(context)); }
  void Pop() {
    if (!context_stack_.empty()) {
      context_stack_.pop_back();
    }
  }
  [[nodiscard]] std::vector<std::string> Stack() const { return context_stack_; }
  [[nodiscard]] std::string Format(std::string_view message) const {
    std::ostringstream oss;
    oss << message;
    for (auto it = context_stack_.rbegin(); it != context_stack_.rend(); ++it) {
      oss << "\n  while: " << *it;
    }
    return oss.str();
  }

 private:
  std::vector<std::string> context_stack_;
};

class ScopedErrorContext {
 public:
  ScopedErrorContext(ErrorContext& ctx, std::string description) : ctx_(ctx) {
    ctx_.Push(std::move(description));
  }
  ScopedErrorContext(const ScopedErrorContext&) = delete;
  ScopedErrorContext& operator=(const ScopedErrorContext&) = delete;
  ~ScopedErrorContext() { ctx_.Pop(); }

 private:
  ErrorContext& ctx_;
};

std::vector<std::string> MergeContext(const std::vector<std::string>& existing,
                                      const ErrorContext& ctx) {
  auto merged = existing;
  auto stack = ctx.Stack();
  merged.insert(merged.end(), stack.begin(), stack.end());
  return merged;
}

[[noreturn]] void ThrowIoError(const ErrorContext& ctx, int code, std::string message,
                               std::optional<int> native = std::nullopt,
                               Retryability retry = Retryability::kFatal) {
  auto stack = ctx.Stack();
  std::optional<int> native_value = native;
  if (!native_value.has_value() && code != 0) {
    native_value = code;
  }
  throw Error{ErrorDomain::IO, code, ctx.Format(std::move(message)), native_value, retry, std::move(stack)};
}

Error AugmentError(const Error& err, const ErrorContext& ctx) {
  return Error{err.domain,
               err.code,
               ctx.Format(err.what()),
               err.native_code,
               err.retryability,
               MergeContext(err.context, ctx)};
}

[[noreturn]] void RethrowSystemError(const std::system_error& sys_err, const ErrorContext& ctx) {
  auto stack = ctx.Stack();
  throw Error{ErrorDomain::IO,
              sys_err.code().value(),
              ctx.Format(sys_err.what()),
              sys_err.code().value(),
              ClassifyNativeError(sys_err.code().value()),
              std::move(stack)};
}

[[noreturn]] void RethrowUnknownError(const std::exception& ex, const ErrorContext& ctx) {
  throw Error{ErrorDomain::Internal, 0, ctx.Format(ex.what()), std::nullopt,
              Retryability::kFatal, ctx.Stack()};
}

template <typename Func>
auto WithContext(ErrorContext& ctx, std::string description, Func&& fn)
    -> std::invoke_result_t<Func&> {
  ScopedErrorContext scoped(ctx, std::move(description));
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Func&>>) {
      fn();
      return;
    } else {
      return fn();
    }
  } catch (const Error& err) {
    if (err.context.empty()) {
      throw AugmentError(err, ctx);
    }
    throw;
  } catch (const std::system_error& sys_err) {
    RethrowSystemError(sys_err, ctx);
  } catch (const std::exception& ex) {
    RethrowUnknownError(ex, ctx);
  }
}

// rename(2) that never replaces an existing target. Returns 0 or an errno.
int RenameNoReplace(const std::filesystem::path& from, const std::filesystem::path& to) {
  if (::renameat2(AT_FDCWD, from.c_str(), AT_FDCWD, to.c_str(), RENAME_NOREPLACE) == 0) {
    return 0;
  }
  const int err = errno;
  if (err != EINVAL && err != ENOSYS) {
    return err;
  }
  // Filesystems without RENAME_NOREPLACE: link(2) refuses an existing name.
  if (::link(from.c_str(), to.c_str()) != 0) {
    return errno;
  }
  if (::unlink(from.c_str()) != 0) {
    return errno;
  }
  return 0;
}

[[noreturn]] void ThrowMoveError(const ErrorContext& ctx, int err, const std::filesystem::path& to) {
  if (err == EEXIST) {
    throw Error{ErrorDomain::Catalog, errors::catalog::kConstraintViolation,
                ctx.Format(std::string(kMoveErrorMessage) + ": target already exists: " + PathToUtf8String(to)),
                err, Retryability::kFatal, ctx.Stack()};
  }
  ThrowIoError(ctx, errors::io::kMoveFailed, std::string(kMoveErrorMessage) + ": rename failed: " + std::strerror(err),
               err, ClassifyNativeError(err));
}

bool IsTransientFsyncError(int err) {
  return err == EINTR || err == EAGAIN || err == EBUSY;
}

class FdGuard {
 public:
  explicit FdGuard(int fd) noexcept : fd_(fd) {}
  FdGuard(const FdGuard&) = delete;
  FdGuard& operator=(const FdGuard&) = delete;
  ~FdGuard() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }
  int get() const noexcept { return fd_; }
  int release() noexcept {
    int fd = fd_;
    fd_ = -1;
    return fd;
  }

 private:
  int fd_;
};

class TempFileGuard {
 public:
  explicit TempFileGuard(std::filesystem::path path) noexcept : path_(std::move(path)) {}
  TempFileGuard(const TempFileGuard&) = delete;
  TempFileGuard& operator=(const TempFileGuard&) = delete;
  ~TempFileGuard() noexcept {
    if (!path_.empty()) {
      RemovePathNoThrow(path_);
    }
  }

  void Release() noexcept { path_.clear(); }

 private:
  std::filesystem::path path_;
};

void CopyAcrossFilesystems(const std::filesystem::path& from, const std::filesystem::path& temp,
                           ErrorContext& ctx) {
  FdGuard in(WithContext(ctx, "opening staged file", [&]() {
    int handle = ::open(from.c_str(), O_RDONLY | O_CLOEXEC);
    if (handle < 0) {
      const int saved_errno = errno;
      ThrowIoError(ctx, saved_errno, std::string(kMoveErrorMessage) + ": open source failed", saved_errno,
                   ClassifyNativeError(saved_errno));
    }
    return handle;
  }));
  FdGuard out(WithContext(ctx, "creating destination copy", [&]() {
    int handle = ::open(temp.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0644);
    if (handle < 0) {
      const int saved_errno = errno;
      ThrowIoError(ctx, saved_errno, std::string(kMoveErrorMessage) + ": open destination failed",
                   saved_errno, ClassifyNativeError(saved_errno));
    }
    return handle;
  }));

  std::vector<uint8_t> buffer(kCopyBufferSize);
  WithContext(ctx, "copying payload", [&] {
    for (;;) {
      const ssize_t got = ::read(in.get(), buffer.data(), buffer.size());
      if (got < 0) {
        const int saved_errno = errno;
        if (saved_errno == EINTR) {
          continue;
        }
        ThrowIoError(ctx, saved_errno, std::string(kMoveErrorMessage) + ": read failed", saved_errno,
                     ClassifyNativeError(saved_errno));
      }
      if (got == 0) {
        break;
      }
      WriteAll(out.get(), std::span<const uint8_t>(buffer.data(), static_cast<size_t>(got)));
    }
  });
  WithContext(ctx, "syncing destination copy", [&] { SyncFile(out.get()); });
  WithContext(ctx, "closing destination copy", [&] {
    if (::close(out.release()) != 0) {
      const int saved_errno = errno;
      ThrowIoError(ctx, saved_errno, std::string(kMoveErrorMessage) + ": close failed", saved_errno,
                   ClassifyNativeError(saved_errno));
    }
  });
}

}  // namespace

Retryability ClassifyNativeError(int native) {
  switch (native) {
    case EINTR:
    case EAGAIN:
#if defined(EWOULDBLOCK) && EWOULDBLOCK != EAGAIN
    case EWOULDBLOCK:
#endif
      return Retryability::kRetryable;
    case EBUSY:
    case ETIMEDOUT:
      return Retryability::kTransient;
    default:
      break;
  }
  return Retryability::kFatal;
}

void WriteAll(int fd, std::span<const uint8_t> payload) {
  size_t written = 0;
  while (written < payload.size()) {
    auto chunk = ::write(fd, payload.data() + written, payload.size() - written);
    if (chunk < 0) {
      const int saved_errno = errno;
      if (saved_errno == EINTR) {
        continue;
      }
      throw Error{ErrorDomain::IO, saved_errno, "write failed: " + std::string(std::strerror(saved_errno)),
                  saved_errno, ClassifyNativeError(saved_errno)};
    }
    if (chunk == 0) {
      throw Error{ErrorDomain::IO, errors::io::kStagingWriteFailed, "short write", std::nullopt,
                  Retryability::kFatal};
    }
    written += static_cast<size_t>(chunk);
  }
}

void SyncFile(int fd) {
  constexpr int kMaxRetries = 4;
  std::chrono::milliseconds backoff{5};
  for (int attempt = 0;; ++attempt) {
    if (::fsync(fd) == 0) {
      return;
    }
    const int saved_errno = errno;
    if (saved_errno == EINTR) {
      continue;
    }
    if (attempt >= kMaxRetries || !IsTransientFsyncError(saved_errno)) {
      throw Error{ErrorDomain::IO, saved_errno, "fsync failed: " + std::string(std::strerror(saved_errno)),
                  saved_errno, ClassifyNativeError(saved_errno)};
    }
    std::this_thread::sleep_for(backoff);
    backoff *= 2;
  }
}

void SyncDirectory(const std::filesystem::path& dir) {
  int dir_fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (dir_fd < 0) {
    const int saved_errno = errno;
    throw Error{ErrorDomain::IO, saved_errno, "open directory failed: " + PathToUtf8String(dir), saved_errno,
                ClassifyNativeError(saved_errno)};
  }
  if (::fsync(dir_fd) != 0) {
    const int err = errno;
    ::close(dir_fd);
    // Some filesystems reject fsync on directories; the data itself is already synced.
    if (err == EINVAL) {
      return;
    }
    throw Error{ErrorDomain::IO, err, "directory flush failed: " + PathToUtf8String(dir), err,
                ClassifyNativeError(err)};
  }
  ::close(dir_fd);
}

void MoveFile(const std::filesystem::path& from, const std::filesystem::path& to,
              const MoveFileHooks& hooks) {
  ErrorContext ctx;
  ScopedErrorContext root(ctx, "move " + PathToUtf8String(from) + " -> " + PathToUtf8String(to));

  try {
    auto dir = to.parent_path();
    if (dir.empty()) {
      dir = WithContext(ctx, "resolving current working directory", [] {
        return std::filesystem::current_path();
      });
    }
    WithContext(ctx, "creating destination directory", [&] {
      std::error_code ec;
      std::filesystem::create_directories(dir, ec);
      if (ec) {
        ThrowIoError(ctx, errors::io::kMoveFailed,
                     std::string(kMoveErrorMessage) + ": mkdir failed: " + ec.message(), ec.value(),
                     ClassifyNativeError(ec.value()));
      }
    });

    bool renamed = false;
    if (!hooks.force_copy) {
      if (hooks.before_rename) {
        WithContext(ctx, "executing before_rename hook", [&] { hooks.before_rename(from, to); });
      }
      const int err = RenameNoReplace(from, to);
      if (err == 0) {
        renamed = true;
      } else if (err != EXDEV) {
        ThrowMoveError(ctx, err, to);
      }
    }

    if (!renamed) {
      std::filesystem::path temp = to;
      temp += ".part." + GenerateToken(8);
      TempFileGuard cleanup(temp);
      CopyAcrossFilesystems(from, temp, ctx);
      if (hooks.before_rename && hooks.force_copy) {
        WithContext(ctx, "executing before_rename hook", [&] { hooks.before_rename(temp, to); });
      }
      WithContext(ctx, "renaming copy into place", [&] {
        if (const int err = RenameNoReplace(temp, to); err != 0) {
          ThrowMoveError(ctx, err, to);
        }
      });
      cleanup.Release();
      WithContext(ctx, "removing staged source", [&] {
        if (::unlink(from.c_str()) != 0 && errno != ENOENT) {
          const int err = errno;
          ThrowIoError(ctx, errors::io::kMoveFailed,
                       std::string(kMoveErrorMessage) + ": unlink source failed: " + std::strerror(err), err,
                       ClassifyNativeError(err));
        }
      });
    }

    WithContext(ctx, "syncing directory metadata", [&] { SyncDirectory(dir); });
  } catch (const Error& err) {
    if (err.context.empty()) {
      throw AugmentError(err, ctx);
    }
    throw;
  } catch (const std::system_error& sys_err) {
    RethrowSystemError(sys_err, ctx);
  } catch (const std::exception& ex) {
    RethrowUnknownError(ex, ctx);
  }
}

uint64_t QueryAvailableBytes(const std::filesystem::path& path) {
  struct statvfs info {};
  if (::statvfs(path.c_str(), &info) != 0) {
    const int err = errno;
    throw Error{ErrorDomain::IO, errors::io::kDiskSpaceQueryFailed,
                "statvfs failed for " + PathToUtf8String(path) + ": " + std::strerror(err), err,
                ClassifyNativeError(err)};
  }
  return static_cast<uint64_t>(info.f_bavail) * static_cast<uint64_t>(info.f_frsize);
}

void RemovePathNoThrow(const std::filesystem::path& path) noexcept {
  std::error_code ec;
  std::filesystem::remove_all(path, ec);
  if (ec) {
    std::cerr << "cleanup failed for " << path << ": " << ec.message() << '\n';
  }
}

std::string GenerateToken(size_t bytes) {
  std::vector<uint8_t> random(bytes == 0 ? 1 : bytes);
  if (RAND_bytes(random.data(), static_cast<int>(random.size())) != 1) {
    throw Error{ErrorDomain::Internal, 0, "RAND_bytes failed"};
  }
  return HexEncode(random);
}

}  // namespace da::storage
