#include "da/config/config.h"

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdlib>
#include <limits>

#include "da/error.h"
#include "da/transport/byte_stream.h"

namespace da::config {
namespace {

struct EnvBinding {
  std::string_view variable;
  std::string_view key;
};

constexpr std::array<EnvBinding, 10> kEnvBindings{{
    {"DA_BLOCK_SIZE", "block_size"},
    {"DA_ALLOW_ARCHIVE", "allow_archive"},
    {"DA_FREE_SPACE_MB", "free_space_disk_change_mb"},
    {"DA_FETCH_METHOD", "fetch_method"},
    {"DA_CHECKSUM", "checksum"},
    {"DA_RSYNC_BINARY", "rsync_binary"},
    {"DA_HTTP_TIMEOUT", "http_timeout_seconds"},
    {"DA_STREAMS", "streams"},
    {"DA_STAGING_DIR", "staging_dir"},
    {"DA_MUTEX_DISK_ACCESS", "mutex_disk_access"},
}};

[[noreturn]] void ThrowInvalid(std::string_view key, std::string_view value, std::string_view reason) {
  throw Error{ErrorDomain::Config, errors::config::kInvalidValue,
              "Invalid value '" + std::string(value) + "' for " + std::string(key) + ": " + std::string(reason)};
}

uint64_t ParseUnsigned(std::string_view key, std::string_view value, uint64_t min, uint64_t max) {
  uint64_t parsed = 0;
  auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
  if (value.empty() || ec != std::errc() || ptr != value.data() + value.size()) {
    ThrowInvalid(key, value, "expected an unsigned integer");
  }
  if (parsed < min || parsed > max) {
    ThrowInvalid(key, value,
                 "must be between " + std::to_string(min) + " and " + std::to_string(max));
  }
  return parsed;
}

bool ParseBool(std::string_view key, std::string_view value) {
  const std::string lowered = transport::ToLowerAscii(value);
  if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
    return true;
  }
  if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") {
    return false;
  }
  ThrowInvalid(key, value, "expected a boolean");
}

}  // namespace

bool IsConfigKey(std::string_view key) noexcept {
  return std::any_of(kEnvBindings.begin(), kEnvBindings.end(),
                     [key](const EnvBinding& binding) { return binding.key == key; });
}

void ApplySetting(IngestConfig& config, std::string_view key, std::string_view value) {
  if (key == "block_size") {
    config.block_size = static_cast<size_t>(ParseUnsigned(key, value, kMinBlockSize, kMaxBlockSize));
  } else if (key == "allow_archive") {
    config.allow_archive = ParseBool(key, value);
  } else if (key == "free_space_disk_change_mb") {
    config.free_space_disk_change_mb =
        ParseUnsigned(key, value, 0, std::numeric_limits<uint64_t>::max() / kBytesPerMegabyte);
  } else if (key == "fetch_method") {
    auto method = mirror::ParseFetchMethod(value);
    if (!method) {
      ThrowInvalid(key, value, "expected HTTP or RSYNC");
    }
    config.fetch_method = *method;
  } else if (key == "checksum") {
    auto algorithm = checksum::ParseAlgorithm(value);
    if (!algorithm) {
      ThrowInvalid(key, value, "expected crc32 or sha256");
    }
    config.checksum = *algorithm;
  } else if (key == "rsync_binary") {
    if (value.empty()) {
      ThrowInvalid(key, value, "must not be empty");
    }
    config.rsync_binary = std::string(value);
  } else if (key == "http_timeout_seconds") {
    config.http_timeout = std::chrono::seconds(ParseUnsigned(key, value, 1, 86400));
  } else if (key == "streams") {
    config.streams = storage::ParseStreamMapping(value);
  } else if (key == "staging_dir") {
    if (value.empty() || value.find('/') != std::string_view::npos || value == "." || value == "..") {
      ThrowInvalid(key, value, "must be a single directory name");
    }
    config.staging_dir = std::string(value);
  } else if (key == "mutex_disk_access") {
    config.mutex_disk_access = ParseBool(key, value);
  } else {
    throw Error{ErrorDomain::Config, errors::config::kUnknownKey,
                "Unknown configuration key: " + std::string(key)};
  }
}

void ApplyEnvironment(IngestConfig& config) {
  for (const auto& binding : kEnvBindings) {
    const char* raw = std::getenv(std::string(binding.variable).c_str());
    if (!raw) {
      continue;
    }
    ApplySetting(config, binding.key, raw);
  }
}

std::vector<std::string> ApplyFlags(IngestConfig& config, const std::vector<std::string>& args) {
  std::vector<std::string> remaining;
  for (const auto& arg : args) {
    std::string_view view(arg);
    if (view.starts_with("--")) {
      const auto eq = view.find('=');
      if (eq != std::string_view::npos) {
        const auto key = view.substr(2, eq - 2);
        if (IsConfigKey(key)) {
          ApplySetting(config, key, view.substr(eq + 1));
          continue;
        }
      }
    }
    remaining.push_back(arg);
  }
  return remaining;
}

}  // namespace da::config
