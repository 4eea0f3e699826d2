#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace da::storage {

// Per-slot write-path mutexes. One instance is owned by the service and
// shared by every request; entries are created on first use and live as long
// as the registry.
class DiskResourceRegistry {
public:
  DiskResourceRegistry() = default;
  DiskResourceRegistry(const DiskResourceRegistry&) = delete;
  DiskResourceRegistry& operator=(const DiskResourceRegistry&) = delete;

  std::mutex& MutexFor(const std::string& slot_id);

private:
  std::mutex registry_mutex_;
  std::map<std::string, std::unique_ptr<std::mutex>> slots_;
};

// Holds a slot's write path for the lifetime of the object. A
// default-constructed guard holds nothing.
class ScopedDiskLock {
public:
  ScopedDiskLock() = default;
  ScopedDiskLock(const ScopedDiskLock&) = delete;
  ScopedDiskLock& operator=(const ScopedDiskLock&) = delete;
  ScopedDiskLock(ScopedDiskLock&& other) noexcept;
  ScopedDiskLock& operator=(ScopedDiskLock&& other) noexcept;
  ~ScopedDiskLock();

  // Blocks until the slot is free.
  [[nodiscard]] static ScopedDiskLock Acquire(DiskResourceRegistry& registry, const std::string& slot_id);

  // Acquires only when `enabled`; otherwise returns an empty guard.
  [[nodiscard]] static ScopedDiskLock AcquireIf(bool enabled, DiskResourceRegistry& registry,
                                                const std::string& slot_id);

  [[nodiscard]] bool locked() const noexcept { return mutex_ != nullptr; }
  explicit operator bool() const noexcept { return locked(); }

  const std::string& slot_id() const noexcept { return slot_id_; }

private:
  ScopedDiskLock(std::mutex* mutex, std::string slot_id) noexcept;

  void Release() noexcept;

  std::mutex* mutex_{nullptr};
  std::string slot_id_;
};

}  // namespace da::storage
