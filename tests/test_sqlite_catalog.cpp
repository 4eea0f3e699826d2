#include "da/catalog/sqlite_catalog.h"

#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <string>

#include "da/error.h"
#include "test_support.h"

namespace {

using da::catalog::FileRecord;
using da::catalog::SqliteCatalog;
using da::catalog::VolumeInfo;

VolumeInfo Volume(const std::string& id, const std::string& slot, uint64_t available) {
  VolumeInfo volume;
  volume.volume_id = id;
  volume.host_id = "host-a";
  volume.mount_point = "/data/" + id;
  volume.slot_id = slot;
  volume.available_bytes = available;
  return volume;
}

FileRecord Record(const std::string& file_id, int version, const std::string& volume_id = "v1") {
  FileRecord record;
  record.volume_id = volume_id;
  record.relative_path = "2026-10-18/" + std::to_string(version) + "/" + file_id;
  record.file_id = file_id;
  record.file_version = version;
  record.format = "image/x-fits";
  record.file_size = 1024;
  record.uncompressed_size = 1024;
  record.checksum = "cbf43926";
  record.checksum_algorithm = "crc32";
  record.creation_date = da::Clock::now();
  record.ingestion_date = record.creation_date;
  record.io_time_seconds = 0.25;
  return record;
}

int CatalogErrorCode(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const da::Error& err) {
    assert(err.domain == da::ErrorDomain::Catalog);
    return err.code;
  }
  return 0;
}

void TestVolumes() {
  SqliteCatalog catalog(":memory:");
  catalog.RegisterVolume(Volume("v10", "10", 500));
  catalog.RegisterVolume(Volume("v2", "2", 100));
  auto other = Volume("vx", "1", 100);
  other.host_id = "host-b";
  catalog.RegisterVolume(other);

  auto volumes = catalog.ListVolumes("host-a");
  assert(volumes.size() == 2);
  assert(volumes[0].volume_id == "v2" && volumes[1].volume_id == "v10");

  catalog.RecordFileStored("v2", 40);
  catalog.RecordFileStored("v2", 80);
  auto v2 = catalog.GetVolume("v2");
  assert(v2 && v2->file_count == 2 && v2->bytes_stored == 120);
  assert(v2->available_bytes == 0);

  catalog.UpdateAvailableSpace("v2", 4096);
  const auto when = da::Clock::now();
  catalog.MarkVolumeCompleted("v2", when);
  v2 = catalog.GetVolume("v2");
  assert(v2->available_bytes == 4096);
  assert(v2->completed && v2->completion_date);
  const auto drift = *v2->completion_date - when;
  assert(drift < std::chrono::milliseconds(2) && drift > -std::chrono::milliseconds(2));

  // Registering again refreshes placement but keeps the counters.
  auto moved = Volume("v2", "2", 9);
  moved.mount_point = "/data/elsewhere";
  catalog.RegisterVolume(moved);
  v2 = catalog.GetVolume("v2");
  assert(v2->mount_point == "/data/elsewhere" && v2->file_count == 2);

  assert(!catalog.GetVolume("absent"));
  using da::errors::catalog::kNotFound;
  assert(CatalogErrorCode([&] { catalog.RecordFileStored("absent", 1); }) == kNotFound);
  assert(CatalogErrorCode([&] { catalog.MarkVolumeCompleted("absent", when); }) == kNotFound);
}

void TestFilesAndVersions() {
  SqliteCatalog catalog(":memory:");
  catalog.RegisterVolume(Volume("v1", "1", 1 << 20));

  assert(catalog.NextFileVersion("obs.fits") == 1);
  catalog.InsertFile(Record("obs.fits", 1));
  catalog.InsertFile(Record("obs.fits", 3));
  assert(catalog.NextFileVersion("obs.fits") == 4);
  assert(catalog.NextFileVersion("other.fits") == 1);

  const auto found = catalog.FindFile("obs.fits", 3);
  assert(found);
  assert(found->relative_path == "2026-10-18/3/obs.fits");
  assert(found->checksum == "cbf43926" && found->checksum_algorithm == "crc32");
  assert(found->file_size == 1024 && found->compression == "NONE" && found->status == "OK");
  assert(found->io_time_seconds == 0.25);
  assert(!found->container_id);
  assert(!catalog.FindFile("obs.fits", 2));

  using da::errors::catalog::kConstraintViolation;
  assert(CatalogErrorCode([&] { catalog.InsertFile(Record("obs.fits", 1)); }) == kConstraintViolation);
  // Files must land on a registered volume.
  assert(CatalogErrorCode([&] { catalog.InsertFile(Record("orphan", 1, "nowhere")); }) == kConstraintViolation);
}

void TestContainers() {
  SqliteCatalog catalog(":memory:");
  catalog.RegisterVolume(Volume("v1", "1", 1 << 20));
  const auto now = da::Clock::now();
  const auto root = catalog.CreateContainer("A", std::nullopt, 0, now);
  const auto child = catalog.CreateContainer("B", root, 0, now);
  assert(root != child);

  catalog.InsertFile(Record("f1", 1));
  catalog.InsertFile(Record("f2", 1));
  catalog.AddFileToContainer(root, "f1", 1);
  catalog.AddFileToContainer(child, "f2", 1);
  catalog.SetContainerSize(root, 300);
  catalog.SetContainerSize(child, 200);

  const auto a = catalog.GetContainer(root);
  assert(a && a->name == "A" && !a->parent_id && a->size == 300);
  const auto b = catalog.GetContainer(child);
  assert(b && b->parent_id == std::optional<da::catalog::ContainerId>(root) && b->size == 200);
  assert(catalog.ContainerFiles(root) == (std::vector<std::pair<std::string, int>>{{"f1", 1}}));
  assert(!catalog.GetContainer(child + 100));

  using namespace da::errors::catalog;
  assert(CatalogErrorCode([&] { catalog.AddFileToContainer(root, "f1", 1); }) == kConstraintViolation);
  assert(CatalogErrorCode([&] { catalog.AddFileToContainer(root, "ghost", 1); }) == kConstraintViolation);
  assert(CatalogErrorCode([&] { catalog.SetContainerSize(child + 100, 1); }) == kNotFound);
}

void TestPersistence() {
  da::testing::TempDir dir("da_catalog_");
  const auto path = (dir.path() / "catalog.db").string();
  {
    SqliteCatalog catalog(path);
    catalog.RegisterVolume(Volume("v1", "1", 10));
    catalog.InsertFile(Record("kept.fits", 1));
  }
  SqliteCatalog reopened(path);
  assert(reopened.GetVolume("v1"));
  assert(reopened.FindFile("kept.fits", 1));

  assert(CatalogErrorCode([&] { SqliteCatalog bad((dir.path() / "missing" / "x.db").string()); }) ==
         da::errors::catalog::kOpenFailed);
}

}  // namespace

int main() {
  TestVolumes();
  TestFilesAndVersions();
  TestContainers();
  TestPersistence();
  std::cout << "sqlite catalog tests passed" << std::endl;
  return 0;
}
