#include "da/catalog/sqlite_catalog.h"

#include <sqlite3.h>

#include <string>
#include <utility>

#include "da/error.h"

namespace da::catalog {
namespace {

constexpr const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS volumes (
  volume_id        TEXT PRIMARY KEY,
  host_id          TEXT NOT NULL,
  mount_point      TEXT NOT NULL,
  slot_id          TEXT NOT NULL,
  available_bytes  INTEGER NOT NULL DEFAULT 0,
  bytes_stored     INTEGER NOT NULL DEFAULT 0,
  file_count       INTEGER NOT NULL DEFAULT 0,
  completed        INTEGER NOT NULL DEFAULT 0,
  completion_date  TEXT
);
CREATE TABLE IF NOT EXISTS containers (
  container_id     INTEGER PRIMARY KEY AUTOINCREMENT,
  name             TEXT NOT NULL,
  parent_id        INTEGER REFERENCES containers(container_id),
  size             INTEGER NOT NULL DEFAULT 0,
  ingestion_date   TEXT NOT NULL
);
CREATE TABLE IF NOT EXISTS files (
  file_id            TEXT NOT NULL,
  file_version       INTEGER NOT NULL,
  volume_id          TEXT NOT NULL REFERENCES volumes(volume_id),
  relative_path      TEXT NOT NULL,
  format             TEXT NOT NULL,
  file_size          INTEGER NOT NULL,
  uncompressed_size  INTEGER NOT NULL,
  compression        TEXT NOT NULL,
  checksum           TEXT NOT NULL,
  checksum_algorithm TEXT NOT NULL,
  status             TEXT NOT NULL,
  creation_date      TEXT NOT NULL,
  ingestion_date     TEXT NOT NULL,
  io_time            REAL NOT NULL DEFAULT 0,
  container_id       INTEGER REFERENCES containers(container_id),
  UNIQUE(file_id, file_version)
);
CREATE TABLE IF NOT EXISTS container_files (
  container_id  INTEGER NOT NULL REFERENCES containers(container_id),
  file_id       TEXT NOT NULL,
  file_version  INTEGER NOT NULL,
  FOREIGN KEY(file_id, file_version) REFERENCES files(file_id, file_version),
  UNIQUE(container_id, file_id, file_version)
);
CREATE INDEX IF NOT EXISTS idx_volumes_host ON volumes(host_id);
CREATE INDEX IF NOT EXISTS idx_containers_parent ON containers(parent_id);
)SQL";

[[noreturn]] void ThrowCatalogError(sqlite3* db, int rc, const std::string& context) {
  const int extended = db ? sqlite3_extended_errcode(db) : rc;
  const char* detail = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
  const int code = (rc & 0xFF) == SQLITE_CONSTRAINT ? errors::catalog::kConstraintViolation
                                                    : errors::catalog::kStatementFailed;
  const Retryability retry =
      ((rc & 0xFF) == SQLITE_BUSY || (rc & 0xFF) == SQLITE_LOCKED) ? Retryability::kTransient
                                                                   : Retryability::kFatal;
  throw Error{ErrorDomain::Catalog, code, context + ": " + (detail ? detail : "unknown error"), extended,
              retry};
}

class Statement {
public:
  Statement(sqlite3* db, const char* sql) : db_(db) {
    const int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr);
    if (rc != SQLITE_OK) {
      ThrowCatalogError(db_, rc, "prepare failed");
    }
  }
  ~Statement() { sqlite3_finalize(stmt_); }
  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  void Bind(int idx, const std::string& value) {
    Check(sqlite3_bind_text(stmt_, idx, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT));
  }
  void Bind(int idx, int64_t value) { Check(sqlite3_bind_int64(stmt_, idx, value)); }
  void Bind(int idx, uint64_t value) { Bind(idx, static_cast<int64_t>(value)); }
  void Bind(int idx, int value) { Check(sqlite3_bind_int(stmt_, idx, value)); }
  void Bind(int idx, double value) { Check(sqlite3_bind_double(stmt_, idx, value)); }
  void BindNull(int idx) { Check(sqlite3_bind_null(stmt_, idx)); }

  // True while a row is available.
  bool Step() {
    const int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
      return true;
    }
    if (rc == SQLITE_DONE) {
      return false;
    }
    ThrowCatalogError(db_, rc, std::string("step failed for ") + sqlite3_sql(stmt_));
  }

  void Run() {
    while (Step()) {
    }
  }

  bool IsNull(int col) const { return sqlite3_column_type(stmt_, col) == SQLITE_NULL; }
  int64_t Int(int col) const { return sqlite3_column_int64(stmt_, col); }
  double Double(int col) const { return sqlite3_column_double(stmt_, col); }
  std::string Text(int col) const {
    const auto* text = sqlite3_column_text(stmt_, col);
    if (!text) {
      return {};
    }
    return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(sqlite3_column_bytes(stmt_, col)));
  }

private:
  void Check(int rc) {
    if (rc != SQLITE_OK) {
      ThrowCatalogError(db_, rc, "bind failed");
    }
  }

  sqlite3* db_;
  sqlite3_stmt* stmt_{nullptr};
};

Timestamp ColumnTimestamp(const Statement& stmt, int col) {
  auto parsed = ParseTimestamp(stmt.Text(col));
  if (!parsed) {
    throw Error{ErrorDomain::Catalog, errors::catalog::kStatementFailed,
                "malformed timestamp in catalog: " + stmt.Text(col)};
  }
  return *parsed;
}

VolumeInfo ReadVolume(const Statement& stmt) {
  VolumeInfo info;
  info.volume_id = stmt.Text(0);
  info.host_id = stmt.Text(1);
  info.mount_point = stmt.Text(2);
  info.slot_id = stmt.Text(3);
  info.available_bytes = static_cast<uint64_t>(stmt.Int(4));
  info.bytes_stored = static_cast<uint64_t>(stmt.Int(5));
  info.file_count = static_cast<uint64_t>(stmt.Int(6));
  info.completed = stmt.Int(7) != 0;
  if (!stmt.IsNull(8)) {
    info.completion_date = ColumnTimestamp(stmt, 8);
  }
  return info;
}

constexpr const char* kVolumeColumns =
    "SELECT volume_id, host_id, mount_point, slot_id, available_bytes, bytes_stored, file_count, completed, "
    "completion_date FROM volumes ";

void RequireSingleChange(sqlite3* db, const std::string& what) {
  if (sqlite3_changes(db) != 1) {
    throw Error{ErrorDomain::Catalog, errors::catalog::kNotFound, what + " not found in catalog"};
  }
}

}  // namespace

SqliteCatalog::SqliteCatalog(const std::string& db_path) {
  const int rc = sqlite3_open_v2(db_path.c_str(), &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    std::string detail = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    sqlite3_close(db_);
    db_ = nullptr;
    throw Error{ErrorDomain::Catalog, errors::catalog::kOpenFailed,
                "Failed to open catalog " + db_path + ": " + detail, rc};
  }
  sqlite3_busy_timeout(db_, 5000);
  try {
    Execute("PRAGMA foreign_keys=ON;");
    if (db_path != ":memory:" && !db_path.empty()) {
      Execute("PRAGMA journal_mode=WAL;");
    }
    InitSchema();
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteCatalog::~SqliteCatalog() {
  if (db_) {
    sqlite3_close(db_);
  }
}

void SqliteCatalog::Execute(const char* sql) {
  char* message = nullptr;
  const int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &message);
  if (rc != SQLITE_OK) {
    std::string detail = message ? message : "unknown error";
    sqlite3_free(message);
    throw Error{ErrorDomain::Catalog, errors::catalog::kStatementFailed, "catalog exec failed: " + detail, rc};
  }
}

void SqliteCatalog::InitSchema() { Execute(kSchema); }

std::vector<VolumeInfo> SqliteCatalog::ListVolumes(const std::string& host_id) {
  std::lock_guard<std::mutex> guard(mutex_);
  const std::string sql =
      std::string(kVolumeColumns) + "WHERE host_id = ?1 ORDER BY CAST(slot_id AS INTEGER), slot_id, volume_id";
  Statement stmt(db_, sql.c_str());
  stmt.Bind(1, host_id);
  std::vector<VolumeInfo> volumes;
  while (stmt.Step()) {
    volumes.push_back(ReadVolume(stmt));
  }
  return volumes;
}

void SqliteCatalog::RegisterVolume(const VolumeInfo& volume) {
  std::lock_guard<std::mutex> guard(mutex_);
  Statement stmt(db_,
                 "INSERT INTO volumes (volume_id, host_id, mount_point, slot_id, available_bytes, bytes_stored, "
                 "file_count, completed, completion_date) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9) "
                 "ON CONFLICT(volume_id) DO UPDATE SET host_id = excluded.host_id, "
                 "mount_point = excluded.mount_point, slot_id = excluded.slot_id, "
                 "available_bytes = excluded.available_bytes");
  stmt.Bind(1, volume.volume_id);
  stmt.Bind(2, volume.host_id);
  stmt.Bind(3, PathToUtf8String(volume.mount_point));
  stmt.Bind(4, volume.slot_id);
  stmt.Bind(5, volume.available_bytes);
  stmt.Bind(6, volume.bytes_stored);
  stmt.Bind(7, volume.file_count);
  stmt.Bind(8, volume.completed ? 1 : 0);
  if (volume.completion_date) {
    stmt.Bind(9, FormatTimestamp(*volume.completion_date));
  } else {
    stmt.BindNull(9);
  }
  stmt.Run();
}

std::optional<VolumeInfo> SqliteCatalog::GetVolume(const std::string& volume_id) {
  std::lock_guard<std::mutex> guard(mutex_);
  const std::string sql = std::string(kVolumeColumns) + "WHERE volume_id = ?1";
  Statement stmt(db_, sql.c_str());
  stmt.Bind(1, volume_id);
  if (!stmt.Step()) {
    return std::nullopt;
  }
  return ReadVolume(stmt);
}

ContainerId SqliteCatalog::CreateContainer(const std::string& name, std::optional<ContainerId> parent,
                                           uint64_t size, Timestamp ingestion_date) {
  std::lock_guard<std::mutex> guard(mutex_);
  Statement stmt(db_, "INSERT INTO containers (name, parent_id, size, ingestion_date) VALUES (?1, ?2, ?3, ?4)");
  stmt.Bind(1, name);
  if (parent) {
    stmt.Bind(2, *parent);
  } else {
    stmt.BindNull(2);
  }
  stmt.Bind(3, size);
  stmt.Bind(4, FormatTimestamp(ingestion_date));
  stmt.Run();
  return sqlite3_last_insert_rowid(db_);
}

void SqliteCatalog::AddFileToContainer(ContainerId container, const std::string& file_id, int file_version) {
  std::lock_guard<std::mutex> guard(mutex_);
  Statement stmt(db_, "INSERT INTO container_files (container_id, file_id, file_version) VALUES (?1, ?2, ?3)");
  stmt.Bind(1, container);
  stmt.Bind(2, file_id);
  stmt.Bind(3, file_version);
  stmt.Run();
}

void SqliteCatalog::SetContainerSize(ContainerId container, uint64_t size) {
  std::lock_guard<std::mutex> guard(mutex_);
  Statement stmt(db_, "UPDATE containers SET size = ?1 WHERE container_id = ?2");
  stmt.Bind(1, size);
  stmt.Bind(2, container);
  stmt.Run();
  RequireSingleChange(db_, "container " + std::to_string(container));
}

std::optional<ContainerRecord> SqliteCatalog::GetContainer(ContainerId container) {
  std::lock_guard<std::mutex> guard(mutex_);
  Statement stmt(db_,
                 "SELECT container_id, name, parent_id, size, ingestion_date FROM containers WHERE container_id = ?1");
  stmt.Bind(1, container);
  if (!stmt.Step()) {
    return std::nullopt;
  }
  ContainerRecord record;
  record.id = stmt.Int(0);
  record.name = stmt.Text(1);
  if (!stmt.IsNull(2)) {
    record.parent_id = stmt.Int(2);
  }
  record.size = static_cast<uint64_t>(stmt.Int(3));
  record.ingestion_date = ColumnTimestamp(stmt, 4);
  return record;
}

std::vector<std::pair<std::string, int>> SqliteCatalog::ContainerFiles(ContainerId container) {
  std::lock_guard<std::mutex> guard(mutex_);
  Statement stmt(db_, "SELECT file_id, file_version FROM container_files WHERE container_id = ?1 ORDER BY rowid");
  stmt.Bind(1, container);
  std::vector<std::pair<std::string, int>> files;
  while (stmt.Step()) {
    files.emplace_back(stmt.Text(0), static_cast<int>(stmt.Int(1)));
  }
  return files;
}

int SqliteCatalog::NextFileVersion(const std::string& file_id) {
  std::lock_guard<std::mutex> guard(mutex_);
  Statement stmt(db_, "SELECT MAX(file_version) FROM files WHERE file_id = ?1");
  stmt.Bind(1, file_id);
  if (!stmt.Step() || stmt.IsNull(0)) {
    return 1;
  }
  return static_cast<int>(stmt.Int(0)) + 1;
}

void SqliteCatalog::InsertFile(const FileRecord& record) {
  std::lock_guard<std::mutex> guard(mutex_);
  Statement stmt(db_,
                 "INSERT INTO files (file_id, file_version, volume_id, relative_path, format, file_size, "
                 "uncompressed_size, compression, checksum, checksum_algorithm, status, creation_date, "
                 "ingestion_date, io_time, container_id) "
                 "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13, ?14, ?15)");
  stmt.Bind(1, record.file_id);
  stmt.Bind(2, record.file_version);
  stmt.Bind(3, record.volume_id);
  stmt.Bind(4, record.relative_path);
  stmt.Bind(5, record.format);
  stmt.Bind(6, record.file_size);
  stmt.Bind(7, record.uncompressed_size);
  stmt.Bind(8, record.compression);
  stmt.Bind(9, record.checksum);
  stmt.Bind(10, record.checksum_algorithm);
  stmt.Bind(11, record.status);
  stmt.Bind(12, FormatTimestamp(record.creation_date));
  stmt.Bind(13, FormatTimestamp(record.ingestion_date));
  stmt.Bind(14, record.io_time_seconds);
  if (record.container_id) {
    stmt.Bind(15, *record.container_id);
  } else {
    stmt.BindNull(15);
  }
  stmt.Run();
}

std::optional<FileRecord> SqliteCatalog::FindFile(const std::string& file_id, int file_version) {
  std::lock_guard<std::mutex> guard(mutex_);
  Statement stmt(db_,
                 "SELECT volume_id, relative_path, format, file_size, uncompressed_size, compression, checksum, "
                 "checksum_algorithm, status, creation_date, ingestion_date, io_time, container_id "
                 "FROM files WHERE file_id = ?1 AND file_version = ?2");
  stmt.Bind(1, file_id);
  stmt.Bind(2, file_version);
  if (!stmt.Step()) {
    return std::nullopt;
  }
  FileRecord record;
  record.file_id = file_id;
  record.file_version = file_version;
  record.volume_id = stmt.Text(0);
  record.relative_path = stmt.Text(1);
  record.format = stmt.Text(2);
  record.file_size = static_cast<uint64_t>(stmt.Int(3));
  record.uncompressed_size = static_cast<uint64_t>(stmt.Int(4));
  record.compression = stmt.Text(5);
  record.checksum = stmt.Text(6);
  record.checksum_algorithm = stmt.Text(7);
  record.status = stmt.Text(8);
  record.creation_date = ColumnTimestamp(stmt, 9);
  record.ingestion_date = ColumnTimestamp(stmt, 10);
  record.io_time_seconds = stmt.Double(11);
  if (!stmt.IsNull(12)) {
    record.container_id = stmt.Int(12);
  }
  return record;
}

void SqliteCatalog::RecordFileStored(const std::string& volume_id, uint64_t bytes) {
  std::lock_guard<std::mutex> guard(mutex_);
  Statement stmt(db_,
                 "UPDATE volumes SET bytes_stored = bytes_stored + ?1, file_count = file_count + 1, "
                 "available_bytes = MAX(available_bytes - ?1, 0) WHERE volume_id = ?2");
  stmt.Bind(1, bytes);
  stmt.Bind(2, volume_id);
  stmt.Run();
  RequireSingleChange(db_, "volume " + volume_id);
}

void SqliteCatalog::UpdateAvailableSpace(const std::string& volume_id, uint64_t available_bytes) {
  std::lock_guard<std::mutex> guard(mutex_);
  Statement stmt(db_, "UPDATE volumes SET available_bytes = ?1 WHERE volume_id = ?2");
  stmt.Bind(1, available_bytes);
  stmt.Bind(2, volume_id);
  stmt.Run();
  RequireSingleChange(db_, "volume " + volume_id);
}

void SqliteCatalog::MarkVolumeCompleted(const std::string& volume_id, Timestamp when) {
  std::lock_guard<std::mutex> guard(mutex_);
  Statement stmt(db_, "UPDATE volumes SET completed = 1, completion_date = ?1 WHERE volume_id = ?2");
  stmt.Bind(1, FormatTimestamp(when));
  stmt.Bind(2, volume_id);
  stmt.Run();
  RequireSingleChange(db_, "volume " + volume_id);
}

}  // namespace da::catalog
