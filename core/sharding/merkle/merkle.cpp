/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "sharding/merkle/merkle.hpp"

namespace tessera::sharding::merkle {

  namespace {
    using Level = std::vector<MerkleHash>;

    const MerkleHash &siblingOf(const Level &level, size_t index) {
      auto sibling = index ^ 1;
      return sibling < level.size() ? level[sibling] : level[index];
    }

    Level parentLevel(const crypto::Hasher &hasher, const Level &level) {
      Level parent;
      parent.reserve((level.size() + 1) / 2);
      for (size_t i = 0; i < level.size(); i += 2) {
        parent.emplace_back(hasher.sha2_256(level[i], siblingOf(level, i)));
      }
      return parent;
    }
  }  // namespace

  MerkleHash computeRoot(const crypto::Hasher &hasher,
                         std::span<const MerkleHash> leaves) {
    if (leaves.empty()) {
      return MerkleHash{};
    }
    Level level(leaves.begin(), leaves.end());
    while (level.size() > 1) {
      level = parentLevel(hasher, level);
    }
    return level.front();
  }

  std::vector<MerklePath> computePaths(const crypto::Hasher &hasher,
                                       std::span<const MerkleHash> leaves) {
    std::vector<MerklePath> paths(leaves.size());
    Level level(leaves.begin(), leaves.end());
    // position of every leaf's ancestor on the current level
    std::vector<size_t> positions(leaves.size());
    for (size_t i = 0; i < positions.size(); ++i) {
      positions[i] = i;
    }
    while (level.size() > 1) {
      for (size_t leaf = 0; leaf < leaves.size(); ++leaf) {
        paths[leaf].emplace_back(siblingOf(level, positions[leaf]));
        positions[leaf] /= 2;
      }
      level = parentLevel(hasher, level);
    }
    return paths;
  }

  bool verifyPath(const crypto::Hasher &hasher,
                  const MerkleHash &root,
                  const MerkleHash &leaf,
                  size_t index,
                  const MerklePath &path) {
    if (path.size() < sizeof(size_t) * 8 and (index >> path.size()) != 0) {
      return false;
    }
    auto node = leaf;
    for (const auto &sibling : path) {
      node = (index & 1) == 0 ? hasher.sha2_256(node, sibling)
                              : hasher.sha2_256(sibling, node);
      index >>= 1;
    }
    return node == root;
  }

}  // namespace tessera::sharding::merkle
