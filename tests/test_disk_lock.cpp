#include "da/storage/disk_lock.h"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>
#include <utility>

namespace {

void TestSlotsAreSerialized() {
  da::storage::DiskResourceRegistry registry;
  std::atomic<bool> second_acquired{false};

  auto first = da::storage::ScopedDiskLock::Acquire(registry, "slot-1");
  assert(first.locked());
  assert(first.slot_id() == "slot-1");

  std::thread waiter([&] {
    auto second = da::storage::ScopedDiskLock::Acquire(registry, "slot-1");
    second_acquired.store(true);
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  assert(!second_acquired.load() && "second writer must wait for the slot");

  // A different slot is independent.
  auto other = da::storage::ScopedDiskLock::Acquire(registry, "slot-2");
  assert(other.locked());

  {
    auto released = std::move(first);
    assert(!first.locked());
    assert(released.locked());
  }
  waiter.join();
  assert(second_acquired.load());
}

void TestAcquireIfDisabled() {
  da::storage::DiskResourceRegistry registry;
  auto held = da::storage::ScopedDiskLock::Acquire(registry, "slot-1");
  auto skipped = da::storage::ScopedDiskLock::AcquireIf(false, registry, "slot-1");
  assert(!skipped.locked());
  assert(!skipped);
}

void TestMutexIdentity() {
  da::storage::DiskResourceRegistry registry;
  assert(&registry.MutexFor("a") == &registry.MutexFor("a"));
  assert(&registry.MutexFor("a") != &registry.MutexFor("b"));
}

}  // namespace

int main() {
  TestSlotsAreSerialized();
  TestAcquireIfDisabled();
  TestMutexIdentity();
  std::cout << "disk lock tests passed" << std::endl;
  return 0;
}
