#include "da/ingest/metadata_committer.h"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "da/ingest/container_manager.h"
#include "faulty_catalog.h"
#include "test_support.h"

namespace {

struct Fixture {
  Fixture() {
    volume.volume_id = "v1";
    volume.host_id = "host";
    volume.mount_point = dir.path() / "vol";
    volume.slot_id = "1";
    volume.available_bytes = 1ull << 30;
    catalog.RegisterVolume(volume);
  }

  da::staging::StagedFile Stage(const std::string& name, size_t container, size_t size) {
    da::staging::StagedFile file;
    file.container = container;
    file.name = name;
    file.path = dir.path() / "staging" / std::to_string(container) / name;
    file.size = size;
    file.checksum = "00000000";
    file.content_type = "application/octet-stream";
    da::testing::WriteFile(file.path, da::testing::Pattern(size));
    return file;
  }

  da::ingest::CommitRequest Request() const {
    da::ingest::CommitRequest request;
    request.volume = volume;
    request.mime_type = "multipart/mixed";
    return request;
  }

  da::testing::TempDir dir{"da_commit_"};
  da::testing::FaultyCatalog catalog;
  da::catalog::VolumeInfo volume;
};

void TestContainerSizesAndLayout() {
  Fixture fx;
  da::staging::ContainerTree tree;
  const size_t a = tree.AddRoot("A");
  const size_t b = tree.AddChild(a, "B");
  da::ingest::PersistContainers(tree, fx.catalog);
  const std::vector<da::staging::StagedFile> files{fx.Stage("f1", a, 100), fx.Stage("f2", b, 200)};

  da::ingest::MetadataCommitter committer(fx.catalog);
  const auto report = committer.Commit(fx.Request(), files, &tree);
  assert(report.ok());
  assert(report.records.size() == 2);
  assert(!report.orphaned_path);

  const auto& first = report.records[0];
  assert(first.file_id == "f1" && first.file_version == 1);
  assert(first.container_id == tree.node(a).catalog_id);
  assert(first.format == "application/octet-stream");
  assert(first.checksum_algorithm == "crc32");
  const std::string expected_path = da::DateDirectory(first.ingestion_date) + "/f1/1/f1";
  assert(first.relative_path == expected_path);
  assert(std::filesystem::exists(fx.volume.mount_point / expected_path));
  assert(!std::filesystem::exists(files[0].path));
  assert(report.records[1].container_id == tree.node(b).catalog_id);

  assert(tree.node(a).size == 300);
  assert(tree.node(b).size == 200);
  assert(fx.catalog.GetContainer(*tree.node(a).catalog_id)->size == 300);
  assert(fx.catalog.GetContainer(*tree.node(b).catalog_id)->size == 200);
  assert(fx.catalog.set_size_calls() == 2);
  assert(fx.catalog.ContainerFiles(*tree.node(b).catalog_id).size() == 1);

  const auto stored = fx.catalog.GetVolume("v1");
  assert(stored->file_count == 2 && stored->bytes_stored == 300);
  assert(fx.catalog.FindFile("f2", 1)->container_id == tree.node(b).catalog_id);
}

void TestDuplicateIsRejectedBeforeMove() {
  Fixture fx;
  da::ingest::MetadataCommitter committer(fx.catalog);
  auto request = fx.Request();
  request.file_version = 1;
  assert(committer.Commit(request, {fx.Stage("dup", 0, 10)}, nullptr).ok());

  const auto again = fx.Stage("dup", 0, 10);
  const auto report = committer.Commit(request, {again}, nullptr);
  assert(!report.ok());
  assert(report.failure->domain == da::ErrorDomain::Catalog);
  assert(report.failure->code == da::errors::catalog::kConstraintViolation);
  assert(report.records.empty());
  assert(std::filesystem::exists(again.path));
  assert(fx.catalog.GetVolume("v1")->file_count == 1);
}

void TestPartialFailureKeepsEarlierRecords() {
  Fixture fx;
  da::staging::ContainerTree tree;
  const size_t a = tree.AddRoot("A");
  const size_t b = tree.AddChild(a, "B");
  da::ingest::PersistContainers(tree, fx.catalog);
  const std::vector<da::staging::StagedFile> files{fx.Stage("f1", b, 50), fx.Stage("f2", b, 60),
                                                   fx.Stage("f3", a, 70)};

  fx.catalog.FailInsertNumber(2);
  da::ingest::MetadataCommitter committer(fx.catalog);
  const auto report = committer.Commit(fx.Request(), files, &tree);
  assert(!report.ok());
  assert(report.failure->domain == da::ErrorDomain::Catalog);
  assert(report.records.size() == 1 && report.records[0].file_id == "f1");
  assert(report.orphaned_path);
  assert(std::filesystem::exists(*report.orphaned_path));
  assert(std::filesystem::exists(files[2].path));

  // Sizes of containers touched before the failure are still written.
  assert(fx.catalog.GetContainer(*tree.node(b).catalog_id)->size == 50);
  assert(fx.catalog.GetContainer(*tree.node(a).catalog_id)->size == 50);
  assert(fx.catalog.insert_calls() == 2);
}

void TestIdentifierOverrideAndVersions() {
  Fixture fx;
  da::ingest::MetadataCommitter committer(fx.catalog);
  auto request = fx.Request();
  request.file_id = "archive/obs-1";
  request.io_seconds = 1.5;

  auto report = committer.Commit(request, {fx.Stage("upload.bin", 0, 10)}, nullptr);
  assert(report.ok());
  assert(report.records[0].file_id == "archive/obs-1" && report.records[0].file_version == 1);
  assert(report.records[0].io_time_seconds >= 1.5);
  assert(!report.records[0].container_id);
  assert(report.records[0].relative_path ==
         da::DateDirectory(report.records[0].ingestion_date) + "/archive%2Fobs-1/1/upload.bin");

  report = committer.Commit(request, {fx.Stage("upload.bin", 0, 10)}, nullptr);
  assert(report.ok() && report.records[0].file_version == 2);

  // With several files the override does not apply.
  report = committer.Commit(request, {fx.Stage("x1", 0, 1), fx.Stage("x2", 1, 1)}, nullptr);
  assert(report.ok());
  assert(report.records[0].file_id == "x1" && report.records[1].file_id == "x2");
}

void TestMoveFailure() {
  Fixture fx;
  da::storage::MoveFileHooks hooks;
  hooks.before_rename = [](const std::filesystem::path&, const std::filesystem::path&) {
    throw std::runtime_error("disk unplugged");
  };
  da::ingest::MetadataCommitter committer(fx.catalog, hooks);
  const auto staged = fx.Stage("m1", 0, 10);
  const auto report = committer.Commit(fx.Request(), {staged}, nullptr);
  assert(!report.ok());
  assert(report.records.empty());
  assert(!report.orphaned_path);
  assert(std::filesystem::exists(staged.path));
  assert(!fx.catalog.FindFile("m1", 1));
}

void TestExistingTargetIsNeverReplaced() {
  Fixture fx;
  // Another writer claims the final path between the catalog check and the move.
  da::storage::MoveFileHooks hooks;
  hooks.before_rename = [](const std::filesystem::path&, const std::filesystem::path& to) {
    da::testing::WriteFile(to, "earlier payload");
  };
  da::ingest::MetadataCommitter committer(fx.catalog, hooks);
  const auto staged = fx.Stage("race.bin", 0, 10);
  const auto report = committer.Commit(fx.Request(), {staged}, nullptr);
  assert(!report.ok());
  assert(report.failure->domain == da::ErrorDomain::Catalog);
  assert(report.failure->code == da::errors::catalog::kConstraintViolation);
  assert(report.records.empty() && !report.orphaned_path);
  assert(std::filesystem::exists(staged.path));
  assert(!fx.catalog.FindFile("race.bin", 1));

  size_t payloads = 0;
  for (const auto& entry : std::filesystem::recursive_directory_iterator(fx.volume.mount_point)) {
    if (entry.is_regular_file()) {
      assert(da::testing::ReadText(entry.path()) == "earlier payload");
      ++payloads;
    }
  }
  assert(payloads == 1);
}

void TestUntypedPartFormat() {
  Fixture fx;
  da::ingest::MetadataCommitter committer(fx.catalog);
  auto part = fx.Stage("image.fits", 0, 10);
  part.content_type.clear();
  auto report = committer.Commit(fx.Request(), {part}, nullptr);
  assert(report.ok() && report.records[0].format == "image/x-fits");

  // A non-multipart request type applies to untyped files as is.
  auto raw = fx.Stage("raw.dat", 0, 10);
  raw.content_type.clear();
  auto request = fx.Request();
  request.mime_type = "image/x-fits";
  report = committer.Commit(request, {raw}, nullptr);
  assert(report.ok() && report.records[0].format == "image/x-fits");
}

}  // namespace

int main() {
  TestContainerSizesAndLayout();
  TestDuplicateIsRejectedBeforeMove();
  TestPartialFailureKeepsEarlierRecords();
  TestIdentifierOverrideAndVersions();
  TestMoveFailure();
  TestExistingTargetIsNeverReplaced();
  TestUntypedPartFormat();
  std::cout << "metadata committer tests passed" << std::endl;
  return 0;
}
