#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "da/catalog/sqlite_catalog.h"
#include "da/error.h"

namespace da::testing {

  // In-memory SQLite catalog that can be told to fail selected writes.
  class FaultyCatalog final : public catalog::Catalog {
  public:
    FaultyCatalog() : inner_(":memory:") {}

    // Fails the n-th (1-based) InsertFile call from now on.
    void FailInsertNumber(int n) { fail_insert_at_ = inserts_ + n; }
    void FailCreateContainerNumber(int n) { fail_container_at_ = containers_ + n; }
    void FailAllWrites(bool fail) { fail_all_ = fail; }

    int set_size_calls() const noexcept { return set_size_calls_; }
    int insert_calls() const noexcept { return inserts_; }

    std::vector<catalog::VolumeInfo> ListVolumes(const std::string& host_id) override {
      return inner_.ListVolumes(host_id);
    }
    void RegisterVolume(const catalog::VolumeInfo& volume) override { inner_.RegisterVolume(volume); }
    std::optional<catalog::VolumeInfo> GetVolume(const std::string& volume_id) override {
      return inner_.GetVolume(volume_id);
    }

    catalog::ContainerId CreateContainer(const std::string& name, std::optional<catalog::ContainerId> parent,
                                         uint64_t size, Timestamp ingestion_date) override {
      ++containers_;
      if (fail_all_ || (fail_container_at_ && containers_ == *fail_container_at_)) {
        Fail("CreateContainer");
      }
      return inner_.CreateContainer(name, parent, size, ingestion_date);
    }
    void AddFileToContainer(catalog::ContainerId container, const std::string& file_id,
                            int file_version) override {
      inner_.AddFileToContainer(container, file_id, file_version);
    }
    void SetContainerSize(catalog::ContainerId container, uint64_t size) override {
      ++set_size_calls_;
      inner_.SetContainerSize(container, size);
    }
    std::optional<catalog::ContainerRecord> GetContainer(catalog::ContainerId container) override {
      return inner_.GetContainer(container);
    }
    std::vector<std::pair<std::string, int>> ContainerFiles(catalog::ContainerId container) override {
      return inner_.ContainerFiles(container);
    }

    int NextFileVersion(const std::string& file_id) override { return inner_.NextFileVersion(file_id); }
    void InsertFile(const catalog::FileRecord& record) override {
      ++inserts_;
      if (fail_all_ || (fail_insert_at_ && inserts_ == *fail_insert_at_)) {
        Fail("InsertFile");
      }
      inner_.InsertFile(record);
    }
    std::optional<catalog::FileRecord> FindFile(const std::string& file_id, int file_version) override {
      return inner_.FindFile(file_id, file_version);
    }

    void RecordFileStored(const std::string& volume_id, uint64_t bytes) override {
      inner_.RecordFileStored(volume_id, bytes);
    }
    void UpdateAvailableSpace(const std::string& volume_id, uint64_t available_bytes) override {
      inner_.UpdateAvailableSpace(volume_id, available_bytes);
    }
    void MarkVolumeCompleted(const std::string& volume_id, Timestamp when) override {
      inner_.MarkVolumeCompleted(volume_id, when);
    }

  private:
    [[noreturn]] static void Fail(const char* what) {
      throw Error{ErrorDomain::Catalog, errors::catalog::kStatementFailed, std::string("injected failure in ") + what};
    }

    catalog::SqliteCatalog inner_;
    std::optional<int> fail_insert_at_;
    std::optional<int> fail_container_at_;
    bool fail_all_{false};
    int inserts_{0};
    int containers_{0};
    int set_size_calls_{0};
  };

} // namespace da::testing
