#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "da/catalog/catalog.h"
#include "da/common.h"

namespace da::staging {

struct ContainerNode {
  std::string name;
  std::optional<size_t> parent;
  std::vector<size_t> children;
  // Filled in once the node has been persisted.
  std::optional<catalog::ContainerId> catalog_id;
  std::optional<Timestamp> ingestion_date;
  // Sum of the uncompressed sizes of every file below this node.
  uint64_t size{0};
};

// Arena of containers built while a request body is parsed. Nodes are
// addressed by index; the root is always index 0.
class ContainerTree {
public:
  static constexpr size_t kRoot = 0;

  size_t AddRoot(std::string name);
  size_t AddChild(size_t parent, std::string name);

  const ContainerNode& node(size_t index) const;
  ContainerNode& node(size_t index);

  size_t size() const noexcept { return nodes_.size(); }
  bool empty() const noexcept { return nodes_.empty(); }

  // `index` followed by each ancestor up to the root.
  std::vector<size_t> LineageOf(size_t index) const;

  // Names from the root down to `index`, joined with '/'.
  std::string PathOf(size_t index) const;

private:
  std::vector<ContainerNode> nodes_;
};

}  // namespace da::staging
