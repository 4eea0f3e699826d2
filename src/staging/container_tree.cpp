#include "da/staging/container_tree.h"

#include <algorithm>

#include "da/error.h"

namespace da::staging {

size_t ContainerTree::AddRoot(std::string name) {
  if (!nodes_.empty()) {
    throw Error{ErrorDomain::Internal, 0, "Container tree already has a root"};
  }
  ContainerNode root;
  root.name = std::move(name);
  nodes_.push_back(std::move(root));
  return kRoot;
}

size_t ContainerTree::AddChild(size_t parent, std::string name) {
  if (parent >= nodes_.size()) {
    throw Error{ErrorDomain::Internal, 0, "Unknown parent container index " + std::to_string(parent)};
  }
  ContainerNode child;
  child.name = std::move(name);
  child.parent = parent;
  nodes_.push_back(std::move(child));
  const size_t index = nodes_.size() - 1;
  nodes_[parent].children.push_back(index);
  return index;
}

const ContainerNode& ContainerTree::node(size_t index) const {
  if (index >= nodes_.size()) {
    throw Error{ErrorDomain::Internal, 0, "Unknown container index " + std::to_string(index)};
  }
  return nodes_[index];
}

ContainerNode& ContainerTree::node(size_t index) {
  if (index >= nodes_.size()) {
    throw Error{ErrorDomain::Internal, 0, "Unknown container index " + std::to_string(index)};
  }
  return nodes_[index];
}

std::vector<size_t> ContainerTree::LineageOf(size_t index) const {
  std::vector<size_t> lineage;
  std::optional<size_t> current = index;
  while (current) {
    lineage.push_back(*current);
    current = node(*current).parent;
  }
  return lineage;
}

std::string ContainerTree::PathOf(size_t index) const {
  auto lineage = LineageOf(index);
  std::reverse(lineage.begin(), lineage.end());
  std::string path;
  for (size_t idx : lineage) {
    if (!path.empty()) {
      path.push_back('/');
    }
    path += nodes_[idx].name;
  }
  return path;
}

}  // namespace da::staging
