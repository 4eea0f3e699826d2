#include "da/storage/disk_lock.h"

#include <utility>

namespace da::storage {

std::mutex& DiskResourceRegistry::MutexFor(const std::string& slot_id) {
  std::lock_guard<std::mutex> guard(registry_mutex_);
  auto& slot = slots_[slot_id];
  if (!slot) {
    slot = std::make_unique<std::mutex>();
  }
  return *slot;
}

ScopedDiskLock::ScopedDiskLock(std::mutex* mutex, std::string slot_id) noexcept
    : mutex_(mutex), slot_id_(std::move(slot_id)) {}

ScopedDiskLock::ScopedDiskLock(ScopedDiskLock&& other) noexcept { *this = std::move(other); }

ScopedDiskLock& ScopedDiskLock::operator=(ScopedDiskLock&& other) noexcept {
  if (this == &other) {
    return *this;
  }
  Release();
  mutex_ = other.mutex_;
  slot_id_ = std::move(other.slot_id_);
  other.mutex_ = nullptr;
  other.slot_id_.clear();
  return *this;
}

ScopedDiskLock::~ScopedDiskLock() { Release(); }

ScopedDiskLock ScopedDiskLock::Acquire(DiskResourceRegistry& registry, const std::string& slot_id) {
  std::mutex& mutex = registry.MutexFor(slot_id);
  mutex.lock();
  return ScopedDiskLock(&mutex, slot_id);
}

ScopedDiskLock ScopedDiskLock::AcquireIf(bool enabled, DiskResourceRegistry& registry,
                                         const std::string& slot_id) {
  if (!enabled) {
    return {};
  }
  return Acquire(registry, slot_id);
}

void ScopedDiskLock::Release() noexcept {
  if (mutex_ == nullptr) {
    return;
  }
  mutex_->unlock();
  mutex_ = nullptr;
}

}  // namespace da::storage
