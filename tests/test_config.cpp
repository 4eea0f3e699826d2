#include "da/config/config.h"
#include "da/error.h"

#include <cassert>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace {

bool RejectsWith(int code, const char* key, const char* value) {
  da::config::IngestConfig config;
  try {
    da::config::ApplySetting(config, key, value);
  } catch (const da::Error& err) {
    return err.domain == da::ErrorDomain::Config && err.code == code;
  }
  return false;
}

void TestDefaults() {
  const da::config::IngestConfig config;
  assert(config.block_size == 65536);
  assert(config.allow_archive);
  assert(config.free_space_disk_change_mb == 1024);
  assert(config.fetch_method == da::mirror::FetchMethod::kHttp);
  assert(config.checksum == da::checksum::Algorithm::kCrc32);
  assert(config.staging_dir == "staging");
  assert(config.mutex_disk_access);
  assert(config.streams.slots_by_mime.empty());
}

void TestSettings() {
  da::config::IngestConfig config;
  da::config::ApplySetting(config, "block_size", "4096");
  da::config::ApplySetting(config, "allow_archive", "off");
  da::config::ApplySetting(config, "free_space_disk_change_mb", "0");
  da::config::ApplySetting(config, "fetch_method", "RSYNC");
  da::config::ApplySetting(config, "checksum", "sha256");
  da::config::ApplySetting(config, "http_timeout_seconds", "5");
  da::config::ApplySetting(config, "streams", "image/x-fits=s1");
  da::config::ApplySetting(config, "mutex_disk_access", "no");
  assert(config.block_size == 4096);
  assert(!config.allow_archive);
  assert(config.free_space_disk_change_mb == 0);
  assert(config.fetch_method == da::mirror::FetchMethod::kRsync);
  assert(config.checksum == da::checksum::Algorithm::kSha256);
  assert(config.http_timeout == std::chrono::seconds(5));
  assert(config.streams.SlotsFor("image/x-fits") != nullptr);
  assert(!config.mutex_disk_access);

  using namespace da::errors::config;
  assert(RejectsWith(kInvalidValue, "block_size", "512"));
  assert(RejectsWith(kInvalidValue, "block_size", "4k"));
  assert(RejectsWith(kInvalidValue, "allow_archive", "maybe"));
  assert(RejectsWith(kInvalidValue, "fetch_method", "FTP"));
  assert(RejectsWith(kInvalidValue, "checksum", "md5"));
  assert(RejectsWith(kInvalidValue, "staging_dir", "../outside"));
  assert(RejectsWith(kInvalidValue, "http_timeout_seconds", "0"));
  assert(RejectsWith(kUnknownKey, "blocksize", "4096"));
}

void TestEnvironmentAndFlags() {
  ::setenv("DA_BLOCK_SIZE", "2048", 1);
  ::setenv("DA_STAGING_DIR", "incoming", 1);
  da::config::IngestConfig config;
  da::config::ApplyEnvironment(config);
  ::unsetenv("DA_BLOCK_SIZE");
  ::unsetenv("DA_STAGING_DIR");
  assert(config.block_size == 2048);
  assert(config.staging_dir == "incoming");

  const std::vector<std::string> args{"archive", "--block_size=8192", "--file-id=x", "payload.bin",
                                      "--checksum=sha256"};
  const auto rest = da::config::ApplyFlags(config, args);
  assert(config.block_size == 8192);
  assert(config.checksum == da::checksum::Algorithm::kSha256);
  assert(rest.size() == 3);
  assert(rest[0] == "archive" && rest[1] == "--file-id=x" && rest[2] == "payload.bin");

  assert(da::config::IsConfigKey("streams"));
  assert(!da::config::IsConfigKey("catalog"));
}

}  // namespace

int main() {
  TestDefaults();
  TestSettings();
  TestEnvironmentAndFlags();
  std::cout << "config tests passed" << std::endl;
  return 0;
}
