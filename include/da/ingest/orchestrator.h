#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "da/catalog/catalog.h"
#include "da/config/config.h"
#include "da/error.h"
#include "da/ingest/metadata_committer.h"
#include "da/ingest/notifier.h"
#include "da/mirror/resumable_fetch.h"
#include "da/storage/disk_lock.h"
#include "da/transport/byte_stream.h"

namespace da::ingest {

enum class IngestStatus {
  kOk,
  kConfigurationRejected,
  kNoVolumeAvailable,
  kIoFailure,
  kDiskExhausted,
  kResumable,
  kCatalogFailure
};

std::string_view IngestStatusName(IngestStatus status) noexcept;

template <typename T>
struct Outcome {
  IngestStatus status{IngestStatus::kOk};
  std::optional<T> value;
  std::string message;
  std::optional<Error> error;
  // Records committed before a partial-batch failure.
  std::vector<catalog::FileRecord> committed;

  bool ok() const noexcept { return status == IngestStatus::kOk; }
};

enum class ServerState { kOnline, kOffline };
enum class ServerSubstate { kIdle, kBusy };

// Snapshot of the server state taken by the caller for one request.
struct ServiceState {
  ServerState state{ServerState::kOnline};
  ServerSubstate substate{ServerSubstate::kIdle};

  bool AcceptsArchiveRequests() const noexcept {
    return state == ServerState::kOnline &&
           (substate == ServerSubstate::kIdle || substate == ServerSubstate::kBusy);
  }
};

struct MultiFileRequest {
  // Local path or name for a push, http:// or file:// URI for a pull. May
  // carry file_id= and file_version= query parameters.
  std::string uri;
  // Request body for a push. When null the URI is opened and pulled.
  transport::ByteStream* body{nullptr};
  // Empty means guessed from the URI.
  std::string content_type;
  std::optional<uint64_t> declared_size;
  std::optional<std::string> file_id;
  std::optional<int> file_version;
  // Root container name; defaults to the URI base name.
  std::string container_name;
};

struct MultiFileResult {
  std::vector<catalog::FileRecord> records;
  catalog::ContainerRecord root_container;
  std::string volume_id;
  uint64_t bytes_read{0};
  double ingest_rate{0.0};
};

struct MirrorRequest {
  std::string uri;
  std::string file_id;
  int file_version{1};
  // Stable across attempts so a resumption finds the partial file. When
  // empty it is derived from the file id and version on the chosen volume.
  std::filesystem::path staging_path;
  std::string mime_type;
};

// Runs archive requests through volume selection, staging, commit and
// notification. Safe to call from one thread per request.
class IngestOrchestrator {
public:
  IngestOrchestrator(config::IngestConfig config, catalog::Catalog& catalog,
                     storage::DiskResourceRegistry& disk_locks, SubscriptionNotifier& notifier,
                     std::string host_id);

  // Test seams.
  void SetFetchStrategy(std::unique_ptr<mirror::FetchStrategy> strategy);
  void SetSourceFactory(mirror::SourceFactory factory);
  void SetMoveHooks(storage::MoveFileHooks hooks);

  Outcome<MultiFileResult> ArchiveMultiFile(const MultiFileRequest& request, const ServiceState& state);

  // `start_byte` defaults to the current size of the staging file and must
  // equal it when given.
  Outcome<catalog::FileRecord> ArchiveMirror(const MirrorRequest& request, const ServiceState& state,
                                             std::optional<uint64_t> start_byte = std::nullopt);

  const config::IngestConfig& config() const noexcept { return config_; }

private:
  std::optional<IngestStatus> CheckAdmission(const ServiceState& state) const;
  void HandleDiskExhausted(const catalog::VolumeInfo& volume);
  void CheckVolumeSpace(const catalog::VolumeInfo& volume);
  void Notify(const std::vector<catalog::FileRecord>& records);
  std::filesystem::path StagingArea(const catalog::VolumeInfo& volume) const;

  config::IngestConfig config_;
  catalog::Catalog& catalog_;
  storage::DiskResourceRegistry& disk_locks_;
  SubscriptionNotifier& notifier_;
  std::string host_id_;
  std::unique_ptr<mirror::FetchStrategy> fetch_strategy_;
  mirror::SourceFactory source_factory_;
  storage::MoveFileHooks move_hooks_;
};

// Base name a request is known by: the file_id= query value when present,
// else the last path component without query.
std::string UriBaseName(std::string_view uri);

// file_version= query value, if present and numeric.
std::optional<int> UriFileVersion(std::string_view uri);

}  // namespace da::ingest
