#include "da/storage/volume_selector.h"

#include <algorithm>
#include <iterator>

#include "da/error.h"

namespace da::storage {
namespace {

bool IsUsable(const catalog::VolumeInfo& volume) {
  return !volume.completed && volume.available_bytes > 0;
}

std::string_view Trim(std::string_view text) {
  while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
    text.remove_prefix(1);
  }
  while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) {
    text.remove_suffix(1);
  }
  return text;
}

std::vector<std::string_view> Split(std::string_view text, char separator) {
  std::vector<std::string_view> parts;
  size_t start = 0;
  while (start <= text.size()) {
    const size_t end = text.find(separator, start);
    const size_t stop = end == std::string_view::npos ? text.size() : end;
    parts.push_back(Trim(text.substr(start, stop - start)));
    if (end == std::string_view::npos) {
      break;
    }
    start = end + 1;
  }
  return parts;
}

}  // namespace

const std::vector<std::string>* StreamMapping::SlotsFor(std::string_view mime_type) const {
  auto it = slots_by_mime.find(mime_type);
  if (it != slots_by_mime.end()) {
    return &it->second;
  }
  it = slots_by_mime.find(std::string_view{"*"});
  if (it != slots_by_mime.end()) {
    return &it->second;
  }
  return nullptr;
}

StreamMapping ParseStreamMapping(std::string_view text) {
  StreamMapping mapping;
  for (auto entry : Split(text, ';')) {
    if (entry.empty()) {
      continue;
    }
    const auto eq = entry.find('=');
    if (eq == std::string_view::npos || eq == 0) {
      throw Error{ErrorDomain::Config, errors::config::kInvalidValue,
                  "Invalid stream mapping entry: " + std::string(entry)};
    }
    std::vector<std::string> slots;
    for (auto slot : Split(entry.substr(eq + 1), ',')) {
      if (!slot.empty()) {
        slots.emplace_back(slot);
      }
    }
    if (slots.empty()) {
      throw Error{ErrorDomain::Config, errors::config::kInvalidValue,
                  "Stream mapping entry has no slots: " + std::string(entry)};
    }
    mapping.slots_by_mime[std::string(Trim(entry.substr(0, eq)))] = std::move(slots);
  }
  return mapping;
}

std::optional<catalog::VolumeInfo> SelectArchiveVolume(const std::vector<catalog::VolumeInfo>& volumes,
                                                       std::string_view mime_type,
                                                       const StreamMapping& streams) {
  if (const auto* slots = streams.SlotsFor(mime_type)) {
    for (const auto& slot : *slots) {
      for (const auto& volume : volumes) {
        if (volume.slot_id == slot && IsUsable(volume)) {
          return volume;
        }
      }
    }
    return std::nullopt;
  }
  for (const auto& volume : volumes) {
    if (IsUsable(volume)) {
      return volume;
    }
  }
  return std::nullopt;
}

std::optional<catalog::VolumeInfo> SelectMirrorVolume(const std::vector<catalog::VolumeInfo>& volumes) {
  std::vector<catalog::VolumeInfo> candidates;
  std::copy_if(volumes.begin(), volumes.end(), std::back_inserter(candidates),
               [](const catalog::VolumeInfo& volume) { return !volume.completed; });
  if (candidates.empty()) {
    return std::nullopt;
  }
  std::stable_sort(candidates.begin(), candidates.end(),
                   [](const catalog::VolumeInfo& a, const catalog::VolumeInfo& b) {
                     return a.available_bytes > b.available_bytes;
                   });
  return candidates.front();
}

}  // namespace da::storage
