// ZKANCHOR - Merkle Tree over Field Elements
// Copyright (c) 2024 ZKANCHOR Developers
// MIT License
//
// Complete binary Poseidon Merkle tree of fixed depth. Nodes live in one
// flat arena in heap order: depth 0 is the root, position p at depth d is
// stored at (2^d - 1) + p. Unused leaf slots hold a domain-separated
// empty-leaf constant.

#ifndef ZKANCHOR_MERKLE_MERKLE_TREE_H
#define ZKANCHOR_MERKLE_MERKLE_TREE_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "zkanchor/core/types.h"
#include "zkanchor/crypto/field.h"
#include "zkanchor/crypto/poseidon.h"

namespace zkanchor {

namespace util {
class ThreadPool;
}

/// Domain labels for the two Merkle hash usages
namespace MerkleDomain {
    constexpr const char* NODE = "zkanchor.merkle.node";
    constexpr const char* EMPTY_LEAF = "zkanchor.merkle.empty";
}

// ============================================================================
// Merkle Hasher
// ============================================================================

/// Node hash H(left, right) = Poseidon_3(left, right; NODE domain)
class MerkleHasher {
public:
    explicit MerkleHasher(const PrimeField& field);

    const PrimeField& Field() const { return poseidon_.Field(); }
    const Poseidon& Permutation() const { return poseidon_; }

    FieldElement HashNode(const FieldElement& left, const FieldElement& right) const;

    /// Capacity element used for node hashing
    const FieldElement& NodeDomain() const { return nodeDomain_; }

    /// Poseidon_3(0, 0; EMPTY_LEAF domain)
    const FieldElement& EmptyLeaf() const { return emptyLeaf_; }

private:
    Poseidon poseidon_;
    FieldElement nodeDomain_;
    FieldElement emptyLeaf_;
};

// ============================================================================
// Merkle Path
// ============================================================================

/// Sibling chain from a leaf up to the root
struct MerklePath {
    /// siblings[0] is the leaf's sibling, siblings[D-1] the root's child
    std::vector<FieldElement> siblings;

    /// directions[i] is true when the current node at that level is the
    /// right child (its sibling is on the left)
    std::vector<bool> directions;

    size_t Depth() const { return siblings.size(); }

    /// Leaf index encoded by the direction bits
    uint64_t LeafIndex() const;

    /// D x (field width + 1) bytes: each sibling's canonical encoding
    /// followed by a direction byte (0 or 1)
    ByteVector ToBytes() const;

    /// Strict decoding for a tree of `depth` levels. Throws
    /// MerkleError::BadEncoding on a wrong length or direction byte, and
    /// FieldError::NonCanonical on a sibling >= p.
    static MerklePath FromBytes(const PrimeField& field, size_t depth,
                                const Byte* data, size_t len);
    static MerklePath FromBytes(const PrimeField& field, size_t depth,
                                const ByteVector& data) {
        return FromBytes(field, depth, data.data(), data.size());
    }

    bool operator==(const MerklePath& other) const {
        return siblings == other.siblings && directions == other.directions;
    }
};

// ============================================================================
// Merkle Tree
// ============================================================================

class MerkleTree {
public:
    static constexpr size_t MIN_DEPTH = 1;
    static constexpr size_t MAX_DEPTH = 24;

    /// Levels narrower than this are hashed on the calling thread
    static constexpr size_t PARALLEL_THRESHOLD = 64;

    /**
     * Build a tree of the given depth over `leaves`, padding to 2^depth.
     *
     * Throws MerkleError::InvalidDepth outside [1, 24],
     * MerkleError::TooManyLeaves past 2^depth, and
     * ConfigError::ParameterMismatch for a leaf from another field.
     */
    static MerkleTree Build(const PrimeField& field,
                            const std::vector<FieldElement>& leaves,
                            size_t depth);

    /// Same, hashing each level on `pool`
    static MerkleTree Build(const PrimeField& field,
                            const std::vector<FieldElement>& leaves,
                            size_t depth,
                            util::ThreadPool& pool);

    const PrimeField& Field() const { return hasher_.Field(); }
    const MerkleHasher& Hasher() const { return hasher_; }

    const FieldElement& Root() const { return nodes_.front(); }
    size_t Depth() const { return depth_; }
    uint64_t Capacity() const { return uint64_t(1) << depth_; }

    /// Number of leaves supplied at build time (excludes padding)
    uint64_t LeafCount() const { return leafCount_; }

    /// Throws MerkleError::IndexOutOfRange if index >= LeafCount()
    const FieldElement& Leaf(uint64_t index) const;

    /// Node at (depth, position); depth 0 is the root
    const FieldElement& Node(size_t depth, uint64_t position) const;

    /// Throws MerkleError::IndexOutOfRange if index >= LeafCount()
    MerklePath PathFor(uint64_t index) const;

    /// Index of the first leaf equal to `value`
    std::optional<uint64_t> FindLeaf(const FieldElement& value) const;

    /// Verify against this tree's root
    bool Verify(const FieldElement& leaf, const MerklePath& path) const;

    /// Recompute the root from a leaf and its path
    static FieldElement ComputeRoot(const MerkleHasher& hasher,
                                    const FieldElement& leaf,
                                    const MerklePath& path);

    /**
     * Check that (leaf, path) hashes to `root`. Pure; O(depth) hashes.
     * Throws MerkleError::PathLengthMismatch if the path does not have
     * exactly `depth` levels.
     */
    static bool Verify(const MerkleHasher& hasher, size_t depth,
                       const FieldElement& root,
                       const FieldElement& leaf,
                       const MerklePath& path);

    /// Human-readable summary; lists every leaf of small trees and the
    /// first few of large ones
    std::string Describe() const;

private:
    MerkleTree(const PrimeField& field, size_t depth, uint64_t leafCount);

    static size_t Offset(size_t depth, uint64_t position) {
        return (size_t(1) << depth) - 1 + static_cast<size_t>(position);
    }

    void HashLevels(util::ThreadPool* pool);

    MerkleHasher hasher_;
    size_t depth_;
    uint64_t leafCount_;
    std::vector<FieldElement> nodes_;
};

} // namespace zkanchor

#endif // ZKANCHOR_MERKLE_MERKLE_TREE_H
