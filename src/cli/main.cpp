#include <cerrno>
#include <charconv>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <filesystem>
#include <initializer_list>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "da/catalog/sqlite_catalog.h"
#include "da/common.h"
#include "da/config/config.h"
#include "da/error.h"
#include "da/ingest/notifier.h"
#include "da/ingest/orchestrator.h"
#include "da/orchestrator/event_bus.h"
#include "da/storage/disk_lock.h"
#include "da/storage/file_ops.h"
#include "da/transport/byte_stream.h"

namespace {

  constexpr int kExitOk = 0;
  constexpr int kExitUsage = 64;
  constexpr int kExitUnavailable = 69;
  constexpr int kExitIO = 74;
  constexpr int kExitTempFail = 75;
  constexpr int kExitCatalog = 76;

  void PrintUsage() {
    std::cerr << "DataArchive ingestion\n";
    std::cerr << "Usage:\n";
    std::cerr << "  da [--catalog=<db>] [--host=<id>] <command> ...\n";
    std::cerr << "  da volume-add --id=<id> --mount=<dir> --slot=<n>\n";
    std::cerr << "  da volumes\n";
    std::cerr << "  da archive [--content-type=<t>] [--file-id=<id>] [--file-version=<n>]\n";
    std::cerr << "             [--container=<name>] <path-or-uri>\n";
    std::cerr << "  da mirror --file-id=<id> --file-version=<n> [--staging=<path>]\n";
    std::cerr << "            [--start-byte=<n>] [--mime-type=<t>] <uri>\n";
    std::cerr << "\nConfiguration flags (also DA_* environment variables):\n";
    std::cerr << "  --block_size=N --allow_archive=BOOL --free_space_disk_change_mb=N\n";
    std::cerr << "  --fetch_method=HTTP|RSYNC --checksum=crc32|sha256 --rsync_binary=PATH\n";
    std::cerr << "  --http_timeout_seconds=N --streams=MIME=SLOT[,SLOT];... --staging_dir=NAME\n";
    std::cerr << "  --mutex_disk_access=BOOL\n";
  }

  std::string_view DomainPrefix(da::ErrorDomain domain) {
    switch (domain) {
    case da::ErrorDomain::IO:
      return "I/O error";
    case da::ErrorDomain::Validation:
      return "Validation error";
    case da::ErrorDomain::Config:
      return "Configuration error";
    case da::ErrorDomain::Catalog:
      return "Catalog error";
    case da::ErrorDomain::Transport:
      return "Transport error";
    case da::ErrorDomain::Internal:
      return "Internal error";
    }
    return "Error";
  }

  void ReportError(const da::Error& err) {
    std::cerr << DomainPrefix(err.domain) << ": " << err.what() << '\n';
    for (auto it = err.context.rbegin(); it != err.context.rend(); ++it) {
      std::cerr << "  while: " << *it << '\n';
    }

    da::orchestrator::Event event;
    event.category = da::orchestrator::EventCategory::kDiagnostics;
    event.severity = da::orchestrator::EventSeverity::kError;
    event.event_id = "cli_error";
    event.message = err.what();
    event.fields.emplace_back("domain", std::string(DomainPrefix(err.domain)));
    event.fields.emplace_back("code", std::to_string(err.code), da::orchestrator::FieldPrivacy::kPublic, true);
    if (err.native_code.has_value()) {
      event.fields.emplace_back("native_code", std::to_string(*err.native_code),
                                da::orchestrator::FieldPrivacy::kPublic, true);
    }
    try {
      da::orchestrator::EventBus::Instance().Publish(event);
    } catch (const std::exception& publish_error) {
      std::clog << "{\"event\":\"eventbus_error\",\"message\":\"error report publish failed\",\"detail\":\""
                << publish_error.what() << "\"}" << std::endl;
    }
  }

  int ExitCodeFor(const da::Error& err) {
    switch (err.domain) {
    case da::ErrorDomain::Config:
      return kExitUsage;
    case da::ErrorDomain::Catalog:
      return kExitCatalog;
    default:
      return kExitIO;
    }
  }

  int ExitCodeFor(da::ingest::IngestStatus status) {
    switch (status) {
    case da::ingest::IngestStatus::kOk:
      return kExitOk;
    case da::ingest::IngestStatus::kConfigurationRejected:
    case da::ingest::IngestStatus::kNoVolumeAvailable:
      return kExitUnavailable;
    case da::ingest::IngestStatus::kIoFailure:
    case da::ingest::IngestStatus::kDiskExhausted:
      return kExitIO;
    case da::ingest::IngestStatus::kResumable:
      return kExitTempFail;
    case da::ingest::IngestStatus::kCatalogFailure:
      return kExitCatalog;
    }
    return kExitIO;
  }

  // "--name=value" arguments of one command plus its positional arguments.
  struct CommandArgs {
    std::map<std::string, std::string, std::less<>> options;
    std::vector<std::string> positional;

    std::optional<std::string> Get(std::string_view name) const {
      auto it = options.find(name);
      if (it == options.end()) {
        return std::nullopt;
      }
      return it->second;
    }
  };

  std::optional<CommandArgs> ParseCommandArgs(const std::vector<std::string>& args,
                                              std::initializer_list<std::string_view> allowed) {
    CommandArgs parsed;
    for (const auto& arg : args) {
      std::string_view view(arg);
      if (!view.starts_with("--")) {
        parsed.positional.push_back(arg);
        continue;
      }
      const auto eq = view.find('=');
      if (eq == std::string_view::npos || eq == 2) {
        std::cerr << "Malformed option: " << arg << '\n';
        return std::nullopt;
      }
      const auto name = view.substr(2, eq - 2);
      bool known = false;
      for (auto candidate : allowed) {
        known = known || candidate == name;
      }
      if (!known) {
        std::cerr << "Unknown option: --" << name << '\n';
        return std::nullopt;
      }
      parsed.options[std::string(name)] = std::string(view.substr(eq + 1));
    }
    return parsed;
  }

  template <typename T>
  std::optional<T> ParseNumber(std::string_view text) {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc() || ptr != text.data() + text.size()) {
      return std::nullopt;
    }
    return value;
  }

  std::string DefaultHostId() {
    char buffer[256] = {};
    if (::gethostname(buffer, sizeof(buffer) - 1) != 0 || buffer[0] == '\0') {
      return "localhost";
    }
    return buffer;
  }

  std::string DefaultCatalogPath() {
    if (const char* env = std::getenv("DA_CATALOG"); env && *env) {
      return env;
    }
    return "da-catalog.db";
  }

  void PrintRecord(const da::catalog::FileRecord& record) {
    std::cout << record.file_id << " v" << record.file_version << " -> " << record.volume_id << ':'
              << record.relative_path << " (" << record.file_size << " bytes, " << record.checksum_algorithm << ' '
              << record.checksum << ")\n";
  }

  int HandleVolumeAdd(const CommandArgs& args, da::catalog::Catalog& catalog, const std::string& host_id) {
    auto id = args.Get("id");
    auto mount = args.Get("mount");
    auto slot = args.Get("slot");
    if (!id || id->empty() || !mount || mount->empty() || !slot || slot->empty() || !args.positional.empty()) {
      PrintUsage();
      return kExitUsage;
    }
    std::error_code ec;
    std::filesystem::create_directories(*mount, ec);
    if (ec) {
      throw da::Error{da::ErrorDomain::IO, ec.value(), "Failed to create mount point " + *mount + ": " + ec.message(),
                      ec.value()};
    }
    da::catalog::VolumeInfo volume;
    volume.volume_id = *id;
    volume.host_id = host_id;
    volume.mount_point = std::filesystem::absolute(*mount);
    volume.slot_id = *slot;
    volume.available_bytes = da::storage::QueryAvailableBytes(volume.mount_point);
    catalog.RegisterVolume(volume);
    std::cout << "Registered volume " << volume.volume_id << " at " << da::PathToUtf8String(volume.mount_point)
              << " (slot " << volume.slot_id << ", " << volume.available_bytes << " bytes available)\n";
    return kExitOk;
  }

  int HandleVolumes(const CommandArgs& args, da::catalog::Catalog& catalog, const std::string& host_id) {
    if (!args.positional.empty()) {
      PrintUsage();
      return kExitUsage;
    }
    for (const auto& volume : catalog.ListVolumes(host_id)) {
      std::cout << std::left << std::setw(16) << volume.volume_id << " slot=" << std::setw(4) << volume.slot_id
                << " available=" << volume.available_bytes << " stored=" << volume.bytes_stored
                << " files=" << volume.file_count << (volume.completed ? " completed" : "") << "  "
                << da::PathToUtf8String(volume.mount_point) << '\n';
    }
    return kExitOk;
  }

  int HandleArchive(const CommandArgs& args, da::ingest::IngestOrchestrator& orchestrator) {
    if (args.positional.size() != 1) {
      PrintUsage();
      return kExitUsage;
    }
    da::ingest::MultiFileRequest request;
    request.uri = args.positional.front();
    request.content_type = args.Get("content-type").value_or("");
    request.file_id = args.Get("file-id");
    request.container_name = args.Get("container").value_or("");
    if (auto version = args.Get("file-version")) {
      auto parsed = ParseNumber<int>(*version);
      if (!parsed || *parsed <= 0) {
        PrintUsage();
        return kExitUsage;
      }
      request.file_version = parsed;
    }

    // A local path is pushed as the request body; URIs are pulled.
    std::unique_ptr<da::transport::FdByteStream> body;
    if (request.uri.find("://") == std::string::npos) {
      int fd = ::open(request.uri.c_str(), O_RDONLY | O_CLOEXEC);
      if (fd < 0) {
        const int err = errno;
        throw da::Error{da::ErrorDomain::IO, err, "Cannot open " + request.uri + ": " + std::strerror(err), err};
      }
      struct stat info {};
      if (::fstat(fd, &info) != 0) {
        const int err = errno;
        ::close(fd);
        throw da::Error{da::ErrorDomain::IO, err, "Cannot stat " + request.uri + ": " + std::strerror(err), err};
      }
      body = std::make_unique<da::transport::FdByteStream>(fd, true, static_cast<uint64_t>(info.st_size));
      request.body = body.get();
      request.declared_size = static_cast<uint64_t>(info.st_size);
    }

    auto outcome = orchestrator.ArchiveMultiFile(request, da::ingest::ServiceState{});
    for (const auto& record : outcome.committed) {
      PrintRecord(record);
    }
    if (!outcome.ok()) {
      std::cerr << da::ingest::IngestStatusName(outcome.status) << ": " << outcome.message << '\n';
      return ExitCodeFor(outcome.status);
    }
    const auto& root = outcome.value->root_container;
    std::cout << "Container " << root.name << " (id " << root.id << ", " << root.size << " bytes) on "
              << outcome.value->volume_id << '\n';
    return kExitOk;
  }

  int HandleMirror(const CommandArgs& args, da::ingest::IngestOrchestrator& orchestrator) {
    auto file_id = args.Get("file-id");
    auto version_text = args.Get("file-version");
    if (args.positional.size() != 1 || !file_id || file_id->empty() || !version_text) {
      PrintUsage();
      return kExitUsage;
    }
    auto version = ParseNumber<int>(*version_text);
    if (!version || *version <= 0) {
      PrintUsage();
      return kExitUsage;
    }
    std::optional<uint64_t> start_byte;
    if (auto text = args.Get("start-byte")) {
      start_byte = ParseNumber<uint64_t>(*text);
      if (!start_byte) {
        PrintUsage();
        return kExitUsage;
      }
    }

    da::ingest::MirrorRequest request;
    request.uri = args.positional.front();
    request.file_id = *file_id;
    request.file_version = *version;
    request.staging_path = args.Get("staging").value_or("");
    request.mime_type = args.Get("mime-type").value_or("");

    auto outcome = orchestrator.ArchiveMirror(request, da::ingest::ServiceState{}, start_byte);
    if (!outcome.ok()) {
      std::cerr << da::ingest::IngestStatusName(outcome.status) << ": " << outcome.message << '\n';
      return ExitCodeFor(outcome.status);
    }
    PrintRecord(*outcome.value);
    return kExitOk;
  }

} // namespace

int main(int argc, char** argv) {
  try {
    std::vector<std::string> args(argv + 1, argv + argc);

    da::config::IngestConfig config;
    da::config::ApplyEnvironment(config);
    args = da::config::ApplyFlags(config, args);

    std::string catalog_path = DefaultCatalogPath();
    std::string host_id = DefaultHostId();
    size_t index = 0;
    for (; index < args.size(); ++index) {
      std::string_view arg = args[index];
      if (!arg.starts_with("--")) {
        break;
      }
      if (arg.starts_with("--catalog=")) {
        catalog_path = std::string(arg.substr(std::string_view("--catalog=").size()));
        continue;
      }
      if (arg.starts_with("--host=")) {
        host_id = std::string(arg.substr(std::string_view("--host=").size()));
        continue;
      }
      PrintUsage();
      return kExitUsage;
    }
    if (index >= args.size() || catalog_path.empty() || host_id.empty()) {
      PrintUsage();
      return kExitUsage;
    }

    const std::string cmd = args[index++];
    const std::vector<std::string> rest(args.begin() + static_cast<std::ptrdiff_t>(index), args.end());

    da::catalog::SqliteCatalog catalog(catalog_path);

    if (cmd == "volume-add") {
      auto parsed = ParseCommandArgs(rest, {"id", "mount", "slot"});
      if (!parsed) {
        PrintUsage();
        return kExitUsage;
      }
      return HandleVolumeAdd(*parsed, catalog, host_id);
    }
    if (cmd == "volumes") {
      auto parsed = ParseCommandArgs(rest, {});
      if (!parsed) {
        PrintUsage();
        return kExitUsage;
      }
      return HandleVolumes(*parsed, catalog, host_id);
    }

    da::storage::DiskResourceRegistry disk_locks;
    da::ingest::EventBusNotifier notifier;
    da::ingest::IngestOrchestrator orchestrator(config, catalog, disk_locks, notifier, host_id);

    if (cmd == "archive") {
      auto parsed = ParseCommandArgs(rest, {"content-type", "file-id", "file-version", "container"});
      if (!parsed) {
        PrintUsage();
        return kExitUsage;
      }
      return HandleArchive(*parsed, orchestrator);
    }
    if (cmd == "mirror") {
      auto parsed = ParseCommandArgs(rest, {"file-id", "file-version", "staging", "start-byte", "mime-type"});
      if (!parsed) {
        PrintUsage();
        return kExitUsage;
      }
      return HandleMirror(*parsed, orchestrator);
    }

    PrintUsage();
    return kExitUsage;
  } catch (const da::Error& err) {
    ReportError(err);
    return ExitCodeFor(err);
  } catch (const std::exception& err) {
    std::cerr << "I/O error: " << err.what() << std::endl;
    return kExitIO;
  }
}
