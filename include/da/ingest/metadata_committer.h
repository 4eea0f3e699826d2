#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "da/catalog/catalog.h"
#include "da/error.h"
#include "da/staging/container_tree.h"
#include "da/staging/staging_writer.h"
#include "da/storage/file_ops.h"

namespace da::ingest {

struct CommitRequest {
  catalog::VolumeInfo volume;
  // Format recorded for files whose part carried no content type.
  std::string mime_type;
  // Replaces the staged file name as identifier when exactly one file was staged.
  std::optional<std::string> file_id;
  // Used verbatim for every file when set.
  std::optional<int> file_version;
  // I/O time already spent on the request; each record adds its own move.
  double io_seconds{0.0};
};

struct CommitReport {
  std::vector<catalog::FileRecord> records;
  // First failure; files after it were not attempted.
  std::optional<Error> failure;
  // Final location of a file that was moved but never recorded.
  std::optional<std::filesystem::path> orphaned_path;
  double io_seconds{0.0};

  bool ok() const noexcept { return !failure.has_value(); }
};

// Moves staged files onto their volume and records them. Records written
// before a failure stay committed and are listed in the report.
class MetadataCommitter {
public:
  explicit MetadataCommitter(catalog::Catalog& catalog, storage::MoveFileHooks hooks = {});

  // `tree` is null for requests without containers. When present, every
  // container touched by a committed file gets its aggregate size written
  // once, after the last file, also when the batch failed part way.
  CommitReport Commit(const CommitRequest& request, const std::vector<staging::StagedFile>& files,
                      staging::ContainerTree* tree);

private:
  catalog::FileRecord CommitOne(const CommitRequest& request, const staging::StagedFile& file,
                                const std::string& file_id, std::optional<catalog::ContainerId> container_id,
                                CommitReport& report);

  catalog::Catalog& catalog_;
  storage::MoveFileHooks hooks_;
};

}  // namespace da::ingest
