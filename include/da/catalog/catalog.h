#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "da/common.h"

namespace da::catalog {

using ContainerId = int64_t;

struct VolumeInfo {
  std::string volume_id;
  std::string host_id;
  std::filesystem::path mount_point;
  std::string slot_id;
  uint64_t available_bytes{0};
  uint64_t bytes_stored{0};
  uint64_t file_count{0};
  bool completed{false};
  std::optional<Timestamp> completion_date;
};

struct ContainerRecord {
  ContainerId id{0};
  std::string name;
  std::optional<ContainerId> parent_id;
  uint64_t size{0};
  Timestamp ingestion_date{};
};

inline constexpr const char* kCompressionNone = "NONE";
inline constexpr const char* kFileStatusOk = "OK";

struct FileRecord {
  std::string volume_id;
  std::string relative_path;
  std::string file_id;
  int file_version{0};
  std::string format;
  uint64_t file_size{0};
  uint64_t uncompressed_size{0};
  std::string compression{kCompressionNone};
  std::string checksum;
  std::string checksum_algorithm;
  std::string status{kFileStatusOk};
  Timestamp creation_date{};
  Timestamp ingestion_date{};
  double io_time_seconds{0.0};
  std::optional<ContainerId> container_id;
};

// Authoritative metadata store. Every operation is atomic on its own;
// sequences of calls are not. Failures throw Error{ErrorDomain::Catalog}.
class Catalog {
public:
  virtual ~Catalog() = default;

  // Volumes of one host in slot order.
  virtual std::vector<VolumeInfo> ListVolumes(const std::string& host_id) = 0;
  virtual void RegisterVolume(const VolumeInfo& volume) = 0;
  virtual std::optional<VolumeInfo> GetVolume(const std::string& volume_id) = 0;

  virtual ContainerId CreateContainer(const std::string& name, std::optional<ContainerId> parent,
                                      uint64_t size, Timestamp ingestion_date) = 0;
  virtual void AddFileToContainer(ContainerId container, const std::string& file_id, int file_version) = 0;
  virtual void SetContainerSize(ContainerId container, uint64_t size) = 0;
  virtual std::optional<ContainerRecord> GetContainer(ContainerId container) = 0;
  // (file_id, version) pairs in insertion order.
  virtual std::vector<std::pair<std::string, int>> ContainerFiles(ContainerId container) = 0;

  // Highest stored version + 1, or 1 for an unknown identifier.
  virtual int NextFileVersion(const std::string& file_id) = 0;
  // Throws errors::catalog::kConstraintViolation when (file_id, version) exists.
  virtual void InsertFile(const FileRecord& record) = 0;
  virtual std::optional<FileRecord> FindFile(const std::string& file_id, int file_version) = 0;

  // Adds one file of `bytes` to the volume's counters and lowers its
  // available space by the same amount.
  virtual void RecordFileStored(const std::string& volume_id, uint64_t bytes) = 0;
  virtual void UpdateAvailableSpace(const std::string& volume_id, uint64_t available_bytes) = 0;
  virtual void MarkVolumeCompleted(const std::string& volume_id, Timestamp when) = 0;
};

}  // namespace da::catalog
