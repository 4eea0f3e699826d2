#pragma once

#include <optional>

#include "da/catalog/catalog.h"
#include "da/staging/container_tree.h"

namespace da::ingest {

// Persists every node of `tree` before its children, starting at the root.
// Each node receives its catalog id and ingestion date; sizes are stored as
// zero and written later by the committer. A root gets `parent` as its parent
// (usually none).
void PersistContainers(staging::ContainerTree& tree, catalog::Catalog& catalog,
                       std::optional<catalog::ContainerId> parent = std::nullopt);

}  // namespace da::ingest
