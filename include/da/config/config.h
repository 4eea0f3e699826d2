#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "da/checksum/checksum.h"
#include "da/mirror/resumable_fetch.h"
#include "da/storage/volume_selector.h"

namespace da::config {

inline constexpr size_t kMinBlockSize = 1024;
inline constexpr size_t kMaxBlockSize = 64 * 1024 * 1024;

struct IngestConfig {
  size_t block_size{65536};
  bool allow_archive{true};
  // A volume whose free space drops below this is marked completed.
  uint64_t free_space_disk_change_mb{1024};
  mirror::FetchMethod fetch_method{mirror::FetchMethod::kHttp};
  checksum::Algorithm checksum{checksum::Algorithm::kCrc32};
  std::string rsync_binary{"rsync"};
  std::chrono::seconds http_timeout{60};
  storage::StreamMapping streams;
  // Staging area directory name below each volume's mount point.
  std::string staging_dir{"staging"};
  // Serialize writes per volume slot.
  bool mutex_disk_access{true};
};

// Sets one key ("block_size", "allow_archive", ...). Throws
// Error{Config, kUnknownKey} or Error{Config, kInvalidValue}.
void ApplySetting(IngestConfig& config, std::string_view key, std::string_view value);

// Applies every DA_* variable that is set (DA_BLOCK_SIZE, DA_ALLOW_ARCHIVE,
// DA_FREE_SPACE_MB, DA_FETCH_METHOD, DA_CHECKSUM, DA_RSYNC_BINARY,
// DA_HTTP_TIMEOUT, DA_STREAMS, DA_STAGING_DIR, DA_MUTEX_DISK_ACCESS).
void ApplyEnvironment(IngestConfig& config);

// Consumes "--<key>=<value>" arguments naming a configuration key and returns
// the remaining arguments in order.
std::vector<std::string> ApplyFlags(IngestConfig& config, const std::vector<std::string>& args);

bool IsConfigKey(std::string_view key) noexcept;

}  // namespace da::config
