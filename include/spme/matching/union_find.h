#pragma once

#include <cstddef>
#include <numeric>
#include <utility>
#include <vector>

namespace spme::matching {

// UnionFind is a disjoint-set forest over element indices [0, n) with path
// compression and union by size. Grouping is transitive: if a~b and b~c were
// united, a and c share a root even if they were never compared.
class UnionFind {
 public:
  explicit UnionFind(const std::size_t n) : parent_(n), size_(n, 1) {
    std::iota(parent_.begin(), parent_.end(), std::size_t{0});
  }

  [[nodiscard]] std::size_t find(std::size_t i) {
    std::size_t root = i;
    while (parent_[root] != root) {
      root = parent_[root];
    }
    while (parent_[i] != root) {
      const std::size_t next = parent_[i];
      parent_[i] = root;
      i = next;
    }
    return root;
  }

  // unite merges the sets of i and j; returns false when they already shared one.
  bool unite(const std::size_t i, const std::size_t j) {
    std::size_t root_i = find(i);
    std::size_t root_j = find(j);
    if (root_i == root_j) {
      return false;
    }
    if (size_[root_i] < size_[root_j]) {
      std::swap(root_i, root_j);
    }
    parent_[root_j] = root_i;
    size_[root_i] += size_[root_j];
    return true;
  }

  [[nodiscard]] bool connected(const std::size_t i, const std::size_t j) {
    return find(i) == find(j);
  }

  [[nodiscard]] std::size_t size() const { return parent_.size(); }

 private:
  std::vector<std::size_t> parent_;
  std::vector<std::size_t> size_;
};

}  // namespace spme::matching
