#include "da/ingest/orchestrator.h"

#include <cerrno>
#include <charconv>
#include <exception>
#include <system_error>

#include "da/common.h"
#include "da/ingest/container_manager.h"
#include "da/orchestrator/event_bus.h"
#include "da/staging/multipart.h"
#include "da/staging/staging_writer.h"
#include "da/storage/file_ops.h"
#include "da/storage/volume_selector.h"

namespace da::ingest {
namespace {

using orchestrator::Event;
using orchestrator::EventCategory;
using orchestrator::EventField;
using orchestrator::EventSeverity;
using orchestrator::FieldPrivacy;

void Publish(EventSeverity severity, EventCategory category, std::string event_id, std::string message,
             std::vector<EventField> fields = {}) {
  Event event;
  event.severity = severity;
  event.category = category;
  event.event_id = std::move(event_id);
  event.message = std::move(message);
  event.fields = std::move(fields);
  orchestrator::EventBus::Instance().Publish(event);
}

EventField Numeric(std::string key, uint64_t value) {
  return EventField(std::move(key), std::to_string(value), FieldPrivacy::kPublic, true);
}

IngestStatus StatusForError(const Error& error) {
  if (error.native_code && *error.native_code == ENOSPC) {
    return IngestStatus::kDiskExhausted;
  }
  if (error.domain == ErrorDomain::Catalog) {
    return IngestStatus::kCatalogFailure;
  }
  return IngestStatus::kIoFailure;
}

template <typename T>
Outcome<T> Rejected(IngestStatus status, std::string message) {
  Outcome<T> outcome;
  outcome.status = status;
  outcome.message = std::move(message);
  return outcome;
}

template <typename T>
Outcome<T> Failed(IngestStatus status, const Error& error) {
  Outcome<T> outcome;
  outcome.status = status;
  outcome.message = error.what();
  outcome.error = error;
  return outcome;
}

std::optional<std::string> QueryParameter(std::string_view uri, std::string_view key) {
  const auto question = uri.find('?');
  if (question == std::string_view::npos) {
    return std::nullopt;
  }
  std::string_view query = uri.substr(question + 1);
  while (!query.empty()) {
    const auto amp = query.find('&');
    const std::string_view pair = query.substr(0, amp);
    const auto eq = pair.find('=');
    if (eq != std::string_view::npos && pair.substr(0, eq) == key) {
      return std::string(pair.substr(eq + 1));
    }
    if (amp == std::string_view::npos) {
      break;
    }
    query.remove_prefix(amp + 1);
  }
  return std::nullopt;
}

// Mirror staging files are named "<id>___<name>"; the part after the marker
// is the stored file name.
std::string MirrorFileName(const std::filesystem::path& staging_path, const MirrorRequest& request) {
  const std::string staged = staging_path.filename().string();
  const auto marker = staged.find("___");
  if (marker != std::string::npos && marker + 3 < staged.size()) {
    return staged.substr(marker + 3);
  }
  std::string name = staging::SanitizeName(UriBaseName(request.uri));
  return name.empty() ? staging::SanitizeName(request.file_id) : name;
}

}  // namespace

std::string_view IngestStatusName(IngestStatus status) noexcept {
  switch (status) {
  case IngestStatus::kOk:
    return "ok";
  case IngestStatus::kConfigurationRejected:
    return "configuration_rejected";
  case IngestStatus::kNoVolumeAvailable:
    return "no_volume_available";
  case IngestStatus::kIoFailure:
    return "io_failure";
  case IngestStatus::kDiskExhausted:
    return "disk_exhausted";
  case IngestStatus::kResumable:
    return "resumable";
  case IngestStatus::kCatalogFailure:
    return "catalog_failure";
  }
  return "unknown";
}

std::string UriBaseName(std::string_view uri) {
  if (auto file_id = QueryParameter(uri, "file_id"); file_id && !file_id->empty()) {
    return *file_id;
  }
  std::string_view path = uri.substr(0, uri.find('?'));
  while (!path.empty() && path.back() == '/') {
    path.remove_suffix(1);
  }
  const auto slash = path.find_last_of('/');
  if (slash != std::string_view::npos) {
    path.remove_prefix(slash + 1);
  }
  return std::string(path);
}

std::optional<int> UriFileVersion(std::string_view uri) {
  auto raw = QueryParameter(uri, "file_version");
  if (!raw || raw->empty()) {
    return std::nullopt;
  }
  int version = 0;
  auto [ptr, ec] = std::from_chars(raw->data(), raw->data() + raw->size(), version);
  if (ec != std::errc() || ptr != raw->data() + raw->size() || version <= 0) {
    return std::nullopt;
  }
  return version;
}

IngestOrchestrator::IngestOrchestrator(config::IngestConfig config, catalog::Catalog& catalog,
                                       storage::DiskResourceRegistry& disk_locks, SubscriptionNotifier& notifier,
                                       std::string host_id)
    : config_(std::move(config)), catalog_(catalog), disk_locks_(disk_locks), notifier_(notifier),
      host_id_(std::move(host_id)) {
  fetch_strategy_ = mirror::MakeFetchStrategy(config_.fetch_method, config_.block_size, config_.checksum,
                                              config_.rsync_binary, config_.http_timeout);
  source_factory_ = [timeout = config_.http_timeout](std::string_view uri) {
    return transport::MakeRemoteSource(uri, timeout);
  };
}

void IngestOrchestrator::SetFetchStrategy(std::unique_ptr<mirror::FetchStrategy> strategy) {
  fetch_strategy_ = std::move(strategy);
}

void IngestOrchestrator::SetSourceFactory(mirror::SourceFactory factory) {
  source_factory_ = std::move(factory);
}

void IngestOrchestrator::SetMoveHooks(storage::MoveFileHooks hooks) {
  move_hooks_ = std::move(hooks);
}

std::optional<IngestStatus> IngestOrchestrator::CheckAdmission(const ServiceState& state) const {
  if (!config_.allow_archive || !state.AcceptsArchiveRequests()) {
    return IngestStatus::kConfigurationRejected;
  }
  return std::nullopt;
}

std::filesystem::path IngestOrchestrator::StagingArea(const catalog::VolumeInfo& volume) const {
  return volume.mount_point / config_.staging_dir;
}

Outcome<MultiFileResult> IngestOrchestrator::ArchiveMultiFile(const MultiFileRequest& request,
                                                              const ServiceState& state) {
  if (CheckAdmission(state)) {
    Publish(EventSeverity::kWarning, EventCategory::kLifecycle, "archive_rejected",
            "Archive request rejected by server configuration or state", {EventField("uri", request.uri)});
    return Rejected<MultiFileResult>(IngestStatus::kConfigurationRejected,
                                     "Archive requests are not accepted in the current configuration or state");
  }

  const std::string base_name = UriBaseName(request.uri);
  std::string content_type = request.content_type;
  if (staging::ParseHeaderValue(content_type).value.empty()) {
    content_type = staging::GuessMimeType(base_name);
  }
  const std::string mime_type = staging::ParseHeaderValue(content_type).value;

  std::optional<catalog::VolumeInfo> volume;
  try {
    volume = storage::SelectArchiveVolume(catalog_.ListVolumes(host_id_), mime_type, config_.streams);
  } catch (const Error& err) {
    return Failed<MultiFileResult>(IngestStatus::kCatalogFailure, err);
  }
  if (!volume) {
    Publish(EventSeverity::kWarning, EventCategory::kStorage, "no_volume_available",
            "No volume available for archive request",
            {EventField("host_id", host_id_), EventField("mime_type", mime_type)});
    return Rejected<MultiFileResult>(IngestStatus::kNoVolumeAvailable,
                                     "No volume available for " + mime_type + " on " + host_id_);
  }
  Publish(EventSeverity::kInfo, EventCategory::kStorage, "volume_selected", "Target volume selected",
          {EventField("volume_id", volume->volume_id), EventField("slot_id", volume->slot_id),
           EventField("mime_type", mime_type)});

  std::string staging_name = staging::SanitizeName(base_name);
  if (staging_name.empty()) {
    staging_name = "request";
  }
  const std::filesystem::path staging_dir =
      StagingArea(*volume) / (storage::GenerateToken() + "___" + staging_name);

  staging::StagingResult staged;
  std::optional<Error> failure;
  try {
    std::unique_ptr<transport::ByteStream> pulled;
    transport::ByteStream* body = request.body;
    if (!body) {
      auto opened = source_factory_(request.uri)->Open(0);
      pulled = std::move(opened.stream);
      body = pulled.get();
    }
    staging::StagingRequest staging_request;
    staging_request.content_type = content_type;
    staging_request.root_name = request.container_name.empty() ? base_name : request.container_name;
    staging_request.file_name = base_name;
    staging_request.expected_size = staging::EstimateTransferSize(request.uri, *body, request.declared_size);

    Publish(EventSeverity::kInfo, EventCategory::kStorage, "staging_started", "Staging request body",
            {EventField("volume_id", volume->volume_id), EventField("staging_dir", PathToUtf8String(staging_dir)),
             Numeric("expected_size", staging_request.expected_size)});

    auto lock = storage::ScopedDiskLock::AcquireIf(config_.mutex_disk_access, disk_locks_, volume->slot_id);
    staging::StagingWriter writer(config_.block_size, config_.checksum);
    staged = writer.Stage(*body, staging_request, staging_dir);
  } catch (const Error& err) {
    failure = err;
  } catch (const std::exception& ex) {
    failure = ErrorFromException(ex);
  }
  if (failure) {
    const IngestStatus status = StatusForError(*failure);
    if (status == IngestStatus::kDiskExhausted) {
      HandleDiskExhausted(*volume);
    }
    Publish(EventSeverity::kError, EventCategory::kStorage, "staging_failed", failure->what(),
            {EventField("volume_id", volume->volume_id),
             EventField("status", std::string(IngestStatusName(status)))});
    return Failed<MultiFileResult>(status, *failure);
  }
  Publish(EventSeverity::kInfo, EventCategory::kStorage, "staging_finished", "Request body staged",
          {Numeric("files", staged.files.size()), Numeric("bytes_read", staged.bytes_read),
           EventField("ingest_rate", std::to_string(staged.ingest_rate), FieldPrivacy::kPublic, true),
           EventField("reading_seconds", std::to_string(staged.reading_seconds), FieldPrivacy::kPublic, true),
           EventField("checksum_seconds", std::to_string(staged.checksum_seconds), FieldPrivacy::kPublic, true),
           EventField("writing_seconds", std::to_string(staged.writing_seconds), FieldPrivacy::kPublic, true)});

  try {
    PersistContainers(staged.tree, catalog_);
  } catch (const Error& err) {
    storage::RemovePathNoThrow(staging_dir);
    Publish(EventSeverity::kError, EventCategory::kStorage, "containers_failed", err.what());
    return Failed<MultiFileResult>(IngestStatus::kCatalogFailure, err);
  }

  CommitRequest commit_request;
  commit_request.volume = *volume;
  commit_request.mime_type = mime_type;
  commit_request.file_id = request.file_id;
  commit_request.file_version = request.file_version ? request.file_version : UriFileVersion(request.uri);
  commit_request.io_seconds = staged.elapsed_seconds;

  MetadataCommitter committer(catalog_, move_hooks_);
  CommitReport report = committer.Commit(commit_request, staged.files, &staged.tree);
  storage::RemovePathNoThrow(staging_dir);

  if (!report.ok()) {
    const IngestStatus status = StatusForError(*report.failure);
    if (status == IngestStatus::kDiskExhausted) {
      HandleDiskExhausted(*volume);
    }
    std::vector<EventField> fields{EventField("volume_id", volume->volume_id),
                                   Numeric("committed", report.records.size()),
                                   EventField("status", std::string(IngestStatusName(status)))};
    if (report.orphaned_path) {
      fields.emplace_back("final_path", PathToUtf8String(*report.orphaned_path));
    }
    Publish(status == IngestStatus::kCatalogFailure ? EventSeverity::kCritical : EventSeverity::kError,
            EventCategory::kStorage, "commit_failed", report.failure->what(), std::move(fields));
    auto outcome = Failed<MultiFileResult>(status, *report.failure);
    outcome.committed = std::move(report.records);
    return outcome;
  }

  CheckVolumeSpace(*volume);
  Notify(report.records);

  const auto& root = staged.tree.node(staging::ContainerTree::kRoot);
  MultiFileResult result;
  result.root_container.id = root.catalog_id.value_or(0);
  result.root_container.name = root.name;
  result.root_container.size = root.size;
  result.root_container.ingestion_date = root.ingestion_date.value_or(Timestamp{});
  result.records = report.records;
  result.volume_id = volume->volume_id;
  result.bytes_read = staged.bytes_read;
  result.ingest_rate = staged.ingest_rate;

  Publish(EventSeverity::kInfo, EventCategory::kLifecycle, "archive_completed", "Archive request completed",
          {EventField("container", root.name), Numeric("files", result.records.size()),
           Numeric("container_size", root.size)});

  Outcome<MultiFileResult> outcome;
  outcome.committed = report.records;
  outcome.value = std::move(result);
  return outcome;
}

Outcome<catalog::FileRecord> IngestOrchestrator::ArchiveMirror(const MirrorRequest& request,
                                                               const ServiceState& state,
                                                               std::optional<uint64_t> start_byte) {
  if (CheckAdmission(state)) {
    Publish(EventSeverity::kWarning, EventCategory::kLifecycle, "mirror_rejected",
            "Mirror request rejected by server configuration or state", {EventField("file_id", request.file_id)});
    return Rejected<catalog::FileRecord>(IngestStatus::kConfigurationRejected,
                                         "Archive requests are not accepted in the current configuration or state");
  }

  std::optional<catalog::VolumeInfo> volume;
  try {
    volume = storage::SelectMirrorVolume(catalog_.ListVolumes(host_id_));
  } catch (const Error& err) {
    return Failed<catalog::FileRecord>(IngestStatus::kCatalogFailure, err);
  }
  if (!volume) {
    Publish(EventSeverity::kWarning, EventCategory::kStorage, "no_volume_available",
            "No volume available for mirror request", {EventField("host_id", host_id_)});
    return Rejected<catalog::FileRecord>(IngestStatus::kNoVolumeAvailable, "No volume available on " + host_id_);
  }

  std::filesystem::path staging_path = request.staging_path;
  if (staging_path.empty()) {
    std::string name = staging::SanitizeName(UriBaseName(request.uri));
    if (name.empty()) {
      name = staging::SanitizeName(request.file_id);
    }
    staging_path = StagingArea(*volume) / (staging::SanitizeName(request.file_id) + "-v" +
                                           std::to_string(request.file_version) + "___" + name);
  }

  std::error_code ec;
  std::filesystem::create_directories(staging_path.parent_path(), ec);
  if (ec) {
    return Failed<catalog::FileRecord>(
        IngestStatus::kIoFailure,
        Error{ErrorDomain::IO, errors::io::kStagingWriteFailed,
              "Failed to create staging area " + PathToUtf8String(staging_path.parent_path()) + ": " + ec.message(),
              ec.value()});
  }
  uint64_t on_disk = 0;
  if (std::filesystem::exists(staging_path, ec)) {
    on_disk = static_cast<uint64_t>(std::filesystem::file_size(staging_path, ec));
    if (ec) {
      return Failed<catalog::FileRecord>(
          IngestStatus::kIoFailure, Error{ErrorDomain::IO, errors::io::kFetchFailed,
                                          "Cannot size staging file " + PathToUtf8String(staging_path), ec.value()});
    }
  }
  const uint64_t offset = start_byte.value_or(on_disk);
  if (offset != on_disk) {
    Publish(EventSeverity::kError, EventCategory::kStorage, "fetch_offset_mismatch",
            "Requested start byte does not match the staging file",
            {Numeric("start_byte", offset), Numeric("staging_size", on_disk)});
    return Failed<catalog::FileRecord>(
        IngestStatus::kIoFailure,
        Error{ErrorDomain::IO, errors::io::kOffsetMismatch,
              "Start byte " + std::to_string(offset) + " differs from staging file size " + std::to_string(on_disk)});
  }

  Publish(EventSeverity::kInfo, EventCategory::kStorage, offset > 0 ? "fetch_resumed" : "fetch_started",
          offset > 0 ? "Resuming mirror transfer" : "Starting mirror transfer",
          {EventField("uri", request.uri, FieldPrivacy::kHash), EventField("volume_id", volume->volume_id),
           EventField("method", std::string(mirror::FetchMethodName(fetch_strategy_->method()))),
           Numeric("start_byte", offset)});

  mirror::FetchProgress progress;
  mirror::FetchResult fetched;
  std::optional<Error> failure;
  try {
    auto lock = storage::ScopedDiskLock::AcquireIf(config_.mutex_disk_access, disk_locks_, volume->slot_id);
    fetched = fetch_strategy_->Fetch(mirror::FetchRequest{request.uri, staging_path, offset}, progress);
  } catch (const Error& err) {
    failure = err;
  } catch (const std::exception& ex) {
    failure = ErrorFromException(ex);
  }
  if (failure) {
    const auto fetch_outcome = mirror::ClassifyFetchFailure(*failure, progress.bytes_received, offset);
    IngestStatus status = IngestStatus::kIoFailure;
    switch (fetch_outcome) {
    case mirror::FetchOutcome::kDiskExhausted:
      storage::RemovePathNoThrow(staging_path);
      HandleDiskExhausted(*volume);
      status = IngestStatus::kDiskExhausted;
      break;
    case mirror::FetchOutcome::kResumable:
      status = IngestStatus::kResumable;
      break;
    case mirror::FetchOutcome::kIoFailure:
      storage::RemovePathNoThrow(staging_path);
      status = IngestStatus::kIoFailure;
      break;
    }
    Publish(fetch_outcome == mirror::FetchOutcome::kResumable ? EventSeverity::kWarning : EventSeverity::kError,
            EventCategory::kStorage, "fetch_failed", failure->what(),
            {EventField("outcome", std::string(mirror::FetchOutcomeName(fetch_outcome))),
             Numeric("bytes_received", progress.bytes_received), Numeric("start_byte", offset),
             EventField("staging_path", PathToUtf8String(staging_path))});
    return Failed<catalog::FileRecord>(status, *failure);
  }

  staging::StagedFile staged;
  staged.path = staging_path;
  staged.name = MirrorFileName(staging_path, request);
  staged.checksum = fetched.checksum;
  staged.algorithm = fetched.algorithm;
  staged.size = fetched.file_size;

  CommitRequest commit_request;
  commit_request.volume = *volume;
  commit_request.mime_type = request.mime_type.empty() ? staging::GuessMimeType(staged.name) : request.mime_type;
  commit_request.file_id = request.file_id;
  commit_request.file_version = request.file_version;
  commit_request.io_seconds = fetched.io_seconds;

  MetadataCommitter committer(catalog_, move_hooks_);
  CommitReport report = committer.Commit(commit_request, {staged}, nullptr);
  if (!report.ok()) {
    const IngestStatus status = StatusForError(*report.failure);
    if (status == IngestStatus::kDiskExhausted) {
      HandleDiskExhausted(*volume);
    }
    std::vector<EventField> fields{EventField("file_id", request.file_id),
                                   Numeric("file_version", static_cast<uint64_t>(request.file_version)),
                                   EventField("status", std::string(IngestStatusName(status)))};
    if (report.orphaned_path) {
      fields.emplace_back("final_path", PathToUtf8String(*report.orphaned_path));
    }
    Publish(status == IngestStatus::kCatalogFailure ? EventSeverity::kCritical : EventSeverity::kError,
            EventCategory::kStorage, "commit_failed", report.failure->what(), std::move(fields));
    return Failed<catalog::FileRecord>(status, *report.failure);
  }

  CheckVolumeSpace(*volume);
  Notify(report.records);
  Publish(EventSeverity::kInfo, EventCategory::kLifecycle, "mirror_completed", "Mirror request completed",
          {EventField("file_id", request.file_id), Numeric("file_size", fetched.file_size),
           Numeric("bytes_received", fetched.bytes_received), EventField("checksum", fetched.checksum)});

  Outcome<catalog::FileRecord> outcome;
  outcome.committed = report.records;
  outcome.value = report.records.front();
  return outcome;
}

void IngestOrchestrator::HandleDiskExhausted(const catalog::VolumeInfo& volume) {
  try {
    catalog_.MarkVolumeCompleted(volume.volume_id, Clock::now());
    Publish(EventSeverity::kWarning, EventCategory::kStorage, "volume_completed",
            "Volume ran out of space and was marked completed", {EventField("volume_id", volume.volume_id)});
  } catch (const Error& err) {
    Publish(EventSeverity::kError, EventCategory::kStorage, "volume_completion_failed", err.what(),
            {EventField("volume_id", volume.volume_id)});
  }
}

void IngestOrchestrator::CheckVolumeSpace(const catalog::VolumeInfo& volume) {
  try {
    const uint64_t available = storage::QueryAvailableBytes(volume.mount_point);
    catalog_.UpdateAvailableSpace(volume.volume_id, available);
    const uint64_t threshold = config_.free_space_disk_change_mb * kBytesPerMegabyte;
    if (available < threshold) {
      catalog_.MarkVolumeCompleted(volume.volume_id, Clock::now());
      Publish(EventSeverity::kWarning, EventCategory::kStorage, "volume_completed",
              "Volume free space dropped below the change threshold",
              {EventField("volume_id", volume.volume_id), Numeric("available_bytes", available),
               Numeric("threshold_bytes", threshold)});
    }
  } catch (const Error& err) {
    Publish(EventSeverity::kWarning, EventCategory::kStorage, "volume_space_check_failed", err.what(),
            {EventField("volume_id", volume.volume_id)});
  }
}

void IngestOrchestrator::Notify(const std::vector<catalog::FileRecord>& records) {
  FileVersionList files;
  files.reserve(records.size());
  for (const auto& record : records) {
    files.emplace_back(record.file_id, record.file_version);
  }
  notifier_.Register(files);
  notifier_.Trigger();
}

}  // namespace da::ingest
