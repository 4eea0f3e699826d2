#include "da/storage/volume_selector.h"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "da/error.h"

namespace {

da::catalog::VolumeInfo Volume(std::string id, std::string slot, uint64_t available, bool completed = false) {
  da::catalog::VolumeInfo volume;
  volume.volume_id = std::move(id);
  volume.host_id = "host";
  volume.mount_point = "/data/" + volume.volume_id;
  volume.slot_id = std::move(slot);
  volume.available_bytes = available;
  volume.completed = completed;
  return volume;
}

void TestParseStreamMapping() {
  const auto mapping = da::storage::ParseStreamMapping(" image/x-fits = s2, s1 ; *=s3;");
  assert(mapping.slots_by_mime.size() == 2);
  const auto* fits = mapping.SlotsFor("image/x-fits");
  assert(fits && fits->size() == 2);
  assert((*fits)[0] == "s2" && (*fits)[1] == "s1");
  const auto* other = mapping.SlotsFor("text/plain");
  assert(other && other->size() == 1 && (*other)[0] == "s3");

  assert(da::storage::ParseStreamMapping("").slots_by_mime.empty());
  assert(da::storage::ParseStreamMapping("a=b").SlotsFor("c") == nullptr);

  for (const char* bad : {"image/x-fits", "=s1", "text/plain=,"}) {
    bool threw = false;
    try {
      (void)da::storage::ParseStreamMapping(bad);
    } catch (const da::Error& err) {
      threw = err.domain == da::ErrorDomain::Config;
    }
    assert(threw);
  }
}

void TestArchiveSelection() {
  const std::vector<da::catalog::VolumeInfo> volumes{
      Volume("v1", "s1", 100), Volume("v2", "s2", 0), Volume("v3", "s3", 50, true), Volume("v4", "s4", 10)};

  // Unmapped types take the first usable volume in catalog order.
  auto chosen = da::storage::SelectArchiveVolume(volumes, "text/plain", {});
  assert(chosen && chosen->volume_id == "v1");

  // Mapping order wins; full and completed volumes are skipped.
  const auto mapping = da::storage::ParseStreamMapping("image/x-fits=s2,s3,s4,s1");
  chosen = da::storage::SelectArchiveVolume(volumes, "image/x-fits", mapping);
  assert(chosen && chosen->volume_id == "v4");

  // A mapping with no usable slot does not fall back to catalog order.
  const auto dead = da::storage::ParseStreamMapping("image/x-fits=s2,s3");
  assert(!da::storage::SelectArchiveVolume(volumes, "image/x-fits", dead));

  std::vector<da::catalog::VolumeInfo> exhausted{Volume("v1", "s1", 0), Volume("v2", "s2", 10, true)};
  assert(!da::storage::SelectArchiveVolume(exhausted, "text/plain", {}));
  assert(!da::storage::SelectArchiveVolume({}, "text/plain", {}));
}

void TestMirrorSelection() {
  const std::vector<da::catalog::VolumeInfo> volumes{Volume("v1", "s1", 100), Volume("v2", "s2", 500, true),
                                                     Volume("v3", "s3", 300), Volume("v4", "s4", 300)};
  auto chosen = da::storage::SelectMirrorVolume(volumes);
  assert(chosen && chosen->volume_id == "v3");

  std::vector<da::catalog::VolumeInfo> done{Volume("v1", "s1", 100, true)};
  assert(!da::storage::SelectMirrorVolume(done));
}

}  // namespace

int main() {
  TestParseStreamMapping();
  TestArchiveSelection();
  TestMirrorSelection();
  std::cout << "volume selector tests passed" << std::endl;
  return 0;
}
