#include "da/ingest/metadata_committer.h"

#include <chrono>
#include <exception>
#include <set>
#include <string_view>

#include <sys/stat.h>

#include "da/checksum/checksum.h"
#include "da/common.h"
#include "da/orchestrator/event_bus.h"
#include "da/staging/multipart.h"

namespace da::ingest {
namespace {

Timestamp ModificationTime(const std::filesystem::path& path, Timestamp fallback) {
  struct stat info {};
  if (::stat(path.c_str(), &info) != 0) {
    return fallback;
  }
  const auto since_epoch = std::chrono::seconds(info.st_mtim.tv_sec) + std::chrono::nanoseconds(info.st_mtim.tv_nsec);
  return Timestamp(std::chrono::duration_cast<Clock::duration>(since_epoch));
}

// Directory name for a file id: '%', path separators and control bytes are
// percent-encoded so distinct ids never share a directory.
std::string FileIdDirectory(std::string_view file_id) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  if (file_id.empty() || file_id == "." || file_id == "..") {
    // A bare '%' is never produced by the encoding below.
    return file_id.empty() ? "%" : (file_id == "." ? "%2E" : "%2E%2E");
  }
  std::string out;
  out.reserve(file_id.size());
  for (unsigned char c : file_id) {
    if (c < 0x20 || c == 0x7F || c == '%' || c == '/' || c == '\\') {
      out.push_back('%');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0x0F]);
    } else {
      out.push_back(static_cast<char>(c));
    }
  }
  return out;
}

void PublishCommitted(const catalog::FileRecord& record) {
  orchestrator::Event event;
  event.category = orchestrator::EventCategory::kStorage;
  event.severity = orchestrator::EventSeverity::kInfo;
  event.event_id = "file_committed";
  event.message = "File record committed";
  event.fields.emplace_back("file_id", record.file_id);
  event.fields.emplace_back("file_version", std::to_string(record.file_version),
                            orchestrator::FieldPrivacy::kPublic, true);
  event.fields.emplace_back("volume_id", record.volume_id);
  event.fields.emplace_back("relative_path", record.relative_path);
  event.fields.emplace_back("file_size", std::to_string(record.file_size), orchestrator::FieldPrivacy::kPublic,
                            true);
  orchestrator::EventBus::Instance().Publish(event);
}

}  // namespace

MetadataCommitter::MetadataCommitter(catalog::Catalog& catalog, storage::MoveFileHooks hooks)
    : catalog_(catalog), hooks_(std::move(hooks)) {}

CommitReport MetadataCommitter::Commit(const CommitRequest& request, const std::vector<staging::StagedFile>& files,
                                       staging::ContainerTree* tree) {
  CommitReport report;
  report.io_seconds = request.io_seconds;
  std::set<size_t> touched;

  try {
    for (const auto& file : files) {
      const std::string file_id = (request.file_id && files.size() == 1) ? *request.file_id : file.name;
      std::optional<catalog::ContainerId> container_id;
      if (tree) {
        const auto& container = tree->node(file.container);
        if (!container.catalog_id) {
          throw Error{ErrorDomain::Internal, 0, "Container '" + container.name + "' was never persisted"};
        }
        container_id = container.catalog_id;
      }
      const catalog::FileRecord record = CommitOne(request, file, file_id, container_id, report);
      report.records.push_back(record);

      if (tree) {
        for (size_t index : tree->LineageOf(file.container)) {
          tree->node(index).size += record.uncompressed_size;
          touched.insert(index);
        }
        catalog_.AddFileToContainer(*container_id, record.file_id, record.file_version);
      }
      catalog_.RecordFileStored(request.volume.volume_id, record.file_size);
      PublishCommitted(record);
    }
  } catch (const Error& err) {
    report.failure = err;
  } catch (const std::exception& ex) {
    report.failure = ErrorFromException(ex);
  }

  if (tree) {
    for (size_t index : touched) {
      const auto& node = tree->node(index);
      if (!node.catalog_id) {
        continue;
      }
      try {
        catalog_.SetContainerSize(*node.catalog_id, node.size);
      } catch (const Error& err) {
        if (!report.failure) {
          report.failure = err;
        }
      }
    }
  }
  return report;
}

catalog::FileRecord MetadataCommitter::CommitOne(const CommitRequest& request, const staging::StagedFile& file,
                                                 const std::string& file_id,
                                                 std::optional<catalog::ContainerId> container_id,
                                                 CommitReport& report) {
  const int version = request.file_version ? *request.file_version : catalog_.NextFileVersion(file_id);
  if (catalog_.FindFile(file_id, version)) {
    throw Error{ErrorDomain::Catalog, errors::catalog::kConstraintViolation,
                "File " + file_id + " version " + std::to_string(version) + " is already archived"};
  }

  const Timestamp ingestion_date = Clock::now();
  const std::filesystem::path relative =
      std::filesystem::path(DateDirectory(ingestion_date)) / FileIdDirectory(file_id) / std::to_string(version) /
      file.name;
  const std::filesystem::path target = request.volume.mount_point / relative;

  const auto move_start = std::chrono::steady_clock::now();
  storage::MoveFile(file.path, target, hooks_);
  report.io_seconds += SecondsSince(move_start);

  catalog::FileRecord record;
  record.volume_id = request.volume.volume_id;
  record.relative_path = PathToUtf8String(relative);
  record.file_id = file_id;
  record.file_version = version;
  if (!file.content_type.empty()) {
    record.format = file.content_type;
  } else if (staging::IsMultipart(request.mime_type)) {
    // Untyped part of a multipart body.
    record.format = staging::GuessMimeType(file.name);
  } else {
    record.format = request.mime_type;
  }
  record.file_size = file.size;
  record.uncompressed_size = file.size;
  record.compression = catalog::kCompressionNone;
  record.checksum = file.checksum;
  record.checksum_algorithm = std::string(checksum::AlgorithmTag(file.algorithm));
  record.status = catalog::kFileStatusOk;
  record.creation_date = ModificationTime(target, ingestion_date);
  record.ingestion_date = ingestion_date;
  record.io_time_seconds = report.io_seconds;
  record.container_id = container_id;

  try {
    catalog_.InsertFile(record);
  } catch (const Error&) {
    report.orphaned_path = target;
    throw;
  }
  return record;
}

}  // namespace da::ingest
