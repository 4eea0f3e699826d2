#include "da/ingest/container_manager.h"

#include <string>

#include "da/common.h"
#include "da/error.h"

namespace da::ingest {
namespace {

void PersistNode(staging::ContainerTree& tree, catalog::Catalog& catalog, size_t index,
                 std::optional<catalog::ContainerId> parent) {
  auto& node = tree.node(index);
  const Timestamp now = Clock::now();
  node.catalog_id = catalog.CreateContainer(node.name, parent, 0, now);
  node.ingestion_date = now;
  for (size_t child : node.children) {
    PersistNode(tree, catalog, child, node.catalog_id);
  }
}

}  // namespace

void PersistContainers(staging::ContainerTree& tree, catalog::Catalog& catalog,
                       std::optional<catalog::ContainerId> parent) {
  if (tree.empty()) {
    throw Error{ErrorDomain::Internal, 0, "No containers to persist"};
  }
  PersistNode(tree, catalog, staging::ContainerTree::kRoot, parent);
}

}  // namespace da::ingest
