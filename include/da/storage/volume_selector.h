#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "da/catalog/catalog.h"

namespace da::storage {

// MIME type -> ordered slot ids. The "*" entry applies to unmapped types.
struct StreamMapping {
  std::map<std::string, std::vector<std::string>, std::less<>> slots_by_mime;

  const std::vector<std::string>* SlotsFor(std::string_view mime_type) const;
};

// Parses "mime=slot,slot;mime=slot". Throws Error{Config} on malformed input.
StreamMapping ParseStreamMapping(std::string_view text);

// First usable volume in stream-mapping order, or in catalog (slot) order when
// the content type has no mapping. Usable means not completed and with
// positive available space.
std::optional<catalog::VolumeInfo> SelectArchiveVolume(const std::vector<catalog::VolumeInfo>& volumes,
                                                       std::string_view mime_type,
                                                       const StreamMapping& streams);

// Non-completed volume with the most available space. Ties keep catalog order.
std::optional<catalog::VolumeInfo> SelectMirrorVolume(const std::vector<catalog::VolumeInfo>& volumes);

}  // namespace da::storage
