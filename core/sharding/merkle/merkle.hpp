/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <span>
#include <vector>

#include "crypto/hasher.hpp"
#include "sharding/types.hpp"

/**
 * Binary merkle tree over 32-byte leaves. A level of odd length has its last
 * node duplicated, an inner node is `sha256(left || right)`. The root of an
 * empty tree is the zero hash, the root of a single leaf is the leaf itself.
 */
namespace tessera::sharding::merkle {

  MerkleHash computeRoot(const crypto::Hasher &hasher,
                         std::span<const MerkleHash> leaves);

  /**
   * Sibling paths of every leaf, bottom up
   * @return `leaves.size()` paths, each `ceil(log2(leaves.size()))` long
   */
  std::vector<MerklePath> computePaths(const crypto::Hasher &hasher,
                                       std::span<const MerkleHash> leaves);

  /**
   * Checks that `leaf` is at position `index` of the tree with `root`
   */
  bool verifyPath(const crypto::Hasher &hasher,
                  const MerkleHash &root,
                  const MerkleHash &leaf,
                  size_t index,
                  const MerklePath &path);

}  // namespace tessera::sharding::merkle
