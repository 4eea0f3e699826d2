#pragma once

#include <mutex>
#include <string>

#include "da/catalog/catalog.h"

struct sqlite3;

namespace da::catalog {

// Catalog on a single SQLite connection. Statements are serialized by an
// internal mutex so one instance can be shared across request threads.
// ":memory:" opens a private in-memory database.
class SqliteCatalog final : public Catalog {
public:
  explicit SqliteCatalog(const std::string& db_path);
  ~SqliteCatalog() override;

  SqliteCatalog(const SqliteCatalog&) = delete;
  SqliteCatalog& operator=(const SqliteCatalog&) = delete;

  std::vector<VolumeInfo> ListVolumes(const std::string& host_id) override;
  void RegisterVolume(const VolumeInfo& volume) override;
  std::optional<VolumeInfo> GetVolume(const std::string& volume_id) override;

  ContainerId CreateContainer(const std::string& name, std::optional<ContainerId> parent, uint64_t size,
                              Timestamp ingestion_date) override;
  void AddFileToContainer(ContainerId container, const std::string& file_id, int file_version) override;
  void SetContainerSize(ContainerId container, uint64_t size) override;
  std::optional<ContainerRecord> GetContainer(ContainerId container) override;
  std::vector<std::pair<std::string, int>> ContainerFiles(ContainerId container) override;

  int NextFileVersion(const std::string& file_id) override;
  void InsertFile(const FileRecord& record) override;
  std::optional<FileRecord> FindFile(const std::string& file_id, int file_version) override;

  void RecordFileStored(const std::string& volume_id, uint64_t bytes) override;
  void UpdateAvailableSpace(const std::string& volume_id, uint64_t available_bytes) override;
  void MarkVolumeCompleted(const std::string& volume_id, Timestamp when) override;

private:
  void Execute(const char* sql);
  void InitSchema();

  sqlite3* db_{nullptr};
  std::mutex mutex_;
};

}  // namespace da::catalog
