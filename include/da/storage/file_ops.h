#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <span>
#include <string>

#include "da/error.h"

namespace da::storage {

struct MoveFileHooks {
  // Test seam invoked after the payload is in the destination directory and
  // before the final rename.
  std::function<void(const std::filesystem::path&, const std::filesystem::path&)> before_rename;
  // Skips the rename fast path so the cross-filesystem copy runs.
  bool force_copy{false};
};

// Moves a staged file to its final location. Parent directories of the target
// are created. A plain rename is attempted first; across filesystems the file
// is copied to a temporary name beside the target, synced, renamed into place
// and the source unlinked. The target directory is synced before returning.
// An existing target is never replaced: that throws
// Error{Catalog, errors::catalog::kConstraintViolation} with native EEXIST and
// leaves both files untouched. Other failures throw
// Error{IO, errors::io::kMoveFailed or errno}.
void MoveFile(const std::filesystem::path& from, const std::filesystem::path& to,
              const MoveFileHooks& hooks = {});

// Writes the whole buffer, retrying on EINTR. native_code carries errno.
void WriteAll(int fd, std::span<const uint8_t> payload);

// fsync with bounded retry on transient errors.
void SyncFile(int fd);

void SyncDirectory(const std::filesystem::path& dir);

// Bytes available to unprivileged writers on the filesystem holding `path`.
uint64_t QueryAvailableBytes(const std::filesystem::path& path);

// Best effort; failures are reported on std::cerr and otherwise ignored.
void RemovePathNoThrow(const std::filesystem::path& path) noexcept;

Retryability ClassifyNativeError(int native);

// Random lower-case hex token (OpenSSL RAND_bytes) for unique staging names.
std::string GenerateToken(size_t bytes = 16);

}  // namespace da::storage
