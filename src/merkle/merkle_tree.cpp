// ZKANCHOR - Merkle Tree Implementation
// Copyright (c) 2024 ZKANCHOR Developers
// MIT License

#include "zkanchor/merkle/merkle_tree.h"

#include "zkanchor/core/errors.h"
#include "zkanchor/util/logging.h"
#include "zkanchor/util/threadpool.h"

#include <algorithm>
#include <sstream>

namespace zkanchor {

// ============================================================================
// MerkleHasher
// ============================================================================

MerkleHasher::MerkleHasher(const PrimeField& field)
    : poseidon_(field, PoseidonParams::CONFIG_2_1)
    , nodeDomain_(PoseidonDomain(field, MerkleDomain::NODE))
    , emptyLeaf_(poseidon_.Hash2(PoseidonDomain(field, MerkleDomain::EMPTY_LEAF),
                                 field.Zero(), field.Zero())) {}

FieldElement MerkleHasher::HashNode(const FieldElement& left,
                                    const FieldElement& right) const {
    return poseidon_.Hash2(nodeDomain_, left, right);
}

// ============================================================================
// MerklePath
// ============================================================================

uint64_t MerklePath::LeafIndex() const {
    uint64_t index = 0;
    for (size_t i = 0; i < directions.size(); ++i) {
        if (directions[i]) {
            index |= uint64_t(1) << i;
        }
    }
    return index;
}

ByteVector MerklePath::ToBytes() const {
    if (siblings.size() != directions.size()) {
        throw MerkleError(MerkleError::Kind::PathLengthMismatch,
                          "path has " + std::to_string(siblings.size()) +
                          " siblings and " + std::to_string(directions.size()) +
                          " direction bits");
    }

    ByteVector result;
    if (!siblings.empty()) {
        result.reserve(siblings.size() * (siblings.front().Field().ByteWidth() + 1));
    }
    for (size_t i = 0; i < siblings.size(); ++i) {
        ByteVector bytes = siblings[i].ToBytes();
        result.insert(result.end(), bytes.begin(), bytes.end());
        result.push_back(directions[i] ? 1 : 0);
    }
    return result;
}

MerklePath MerklePath::FromBytes(const PrimeField& field, size_t depth,
                                 const Byte* data, size_t len) {
    const size_t entrySize = field.ByteWidth() + 1;
    if (len != depth * entrySize) {
        throw MerkleError(MerkleError::Kind::BadEncoding,
                          "path encoding is " + std::to_string(len) +
                          " bytes, expected " + std::to_string(depth * entrySize));
    }

    MerklePath path;
    path.siblings.reserve(depth);
    path.directions.reserve(depth);

    for (size_t i = 0; i < depth; ++i) {
        const Byte* entry = data + i * entrySize;
        Byte direction = entry[field.ByteWidth()];
        if (direction > 1) {
            throw MerkleError(MerkleError::Kind::BadEncoding,
                              "direction byte " + std::to_string(direction) +
                              " at level " + std::to_string(i));
        }
        path.siblings.push_back(field.FromBytes(entry, field.ByteWidth()));
        path.directions.push_back(direction == 1);
    }
    return path;
}

// ============================================================================
// MerkleTree
// ============================================================================

MerkleTree::MerkleTree(const PrimeField& field, size_t depth, uint64_t leafCount)
    : hasher_(field)
    , depth_(depth)
    , leafCount_(leafCount)
    , nodes_((size_t(2) << depth) - 1, hasher_.EmptyLeaf()) {}

MerkleTree MerkleTree::Build(const PrimeField& field,
                             const std::vector<FieldElement>& leaves,
                             size_t depth) {
    std::shared_ptr<util::ThreadPool> pool = util::GetGlobalThreadPool();
    return Build(field, leaves, depth, *pool);
}

MerkleTree MerkleTree::Build(const PrimeField& field,
                             const std::vector<FieldElement>& leaves,
                             size_t depth,
                             util::ThreadPool& pool) {
    if (depth < MIN_DEPTH || depth > MAX_DEPTH) {
        throw MerkleError(MerkleError::Kind::InvalidDepth,
                          "depth " + std::to_string(depth) + " outside [" +
                          std::to_string(MIN_DEPTH) + ", " +
                          std::to_string(MAX_DEPTH) + "]");
    }
    const uint64_t capacity = uint64_t(1) << depth;
    if (leaves.size() > capacity) {
        throw MerkleError(MerkleError::Kind::TooManyLeaves,
                          std::to_string(leaves.size()) + " leaves exceed capacity " +
                          std::to_string(capacity));
    }
    for (const auto& leaf : leaves) {
        if (leaf.Field() != field) {
            throw ConfigError(ConfigError::Kind::ParameterMismatch,
                              "leaf belongs to the " + leaf.Field().Name() +
                              " field, tree uses " + field.Name());
        }
    }

    ZKANCHOR_LOG_TIMER(util::LogCategory::MERKLE, "Merkle build");

    MerkleTree tree(field, depth, leaves.size());
    for (size_t i = 0; i < leaves.size(); ++i) {
        tree.nodes_[Offset(depth, i)] = leaves[i];
    }
    tree.HashLevels(&pool);

    LOG_DEBUG(util::LogCategory::MERKLE) << "Built depth-" << depth << " tree with "
        << leaves.size() << "/" << capacity << " leaves, root "
        << tree.Root().ToHex();
    return tree;
}

void MerkleTree::HashLevels(util::ThreadPool* pool) {
    // Subtrees containing only padding share one hash per height
    FieldElement emptySubtree = hasher_.EmptyLeaf();

    for (size_t d = depth_; d-- > 0;) {
        const size_t height = depth_ - d;
        emptySubtree = hasher_.HashNode(emptySubtree, emptySubtree);

        const uint64_t width = uint64_t(1) << d;
        const uint64_t span = uint64_t(1) << height;
        const uint64_t occupied = std::min<uint64_t>(width, (leafCount_ + span - 1) / span);

        for (uint64_t i = occupied; i < width; ++i) {
            nodes_[Offset(d, i)] = emptySubtree;
        }

        auto hashRange = [this, d](size_t begin, size_t end) {
            for (size_t i = begin; i < end; ++i) {
                nodes_[Offset(d, i)] = hasher_.HashNode(nodes_[Offset(d + 1, 2 * i)],
                                                        nodes_[Offset(d + 1, 2 * i + 1)]);
            }
        };

        if (pool != nullptr) {
            util::ParallelForChunks(static_cast<size_t>(occupied),
                                    PARALLEL_THRESHOLD, hashRange, *pool);
        } else {
            hashRange(0, static_cast<size_t>(occupied));
        }
    }
}

const FieldElement& MerkleTree::Leaf(uint64_t index) const {
    if (index >= leafCount_) {
        throw MerkleError(MerkleError::Kind::IndexOutOfRange,
                          "leaf " + std::to_string(index) + " of " +
                          std::to_string(leafCount_));
    }
    return nodes_[Offset(depth_, index)];
}

const FieldElement& MerkleTree::Node(size_t depth, uint64_t position) const {
    if (depth > depth_ || position >= (uint64_t(1) << depth)) {
        throw MerkleError(MerkleError::Kind::IndexOutOfRange,
                          "node (" + std::to_string(depth) + ", " +
                          std::to_string(position) + ") outside the tree");
    }
    return nodes_[Offset(depth, position)];
}

MerklePath MerkleTree::PathFor(uint64_t index) const {
    if (index >= leafCount_) {
        throw MerkleError(MerkleError::Kind::IndexOutOfRange,
                          "leaf " + std::to_string(index) + " of " +
                          std::to_string(leafCount_));
    }

    MerklePath path;
    path.siblings.reserve(depth_);
    path.directions.reserve(depth_);

    uint64_t pos = index;
    for (size_t d = depth_; d > 0; --d) {
        bool isRight = (pos & 1) != 0;
        path.siblings.push_back(nodes_[Offset(d, pos ^ 1)]);
        path.directions.push_back(isRight);
        pos >>= 1;
    }
    return path;
}

std::optional<uint64_t> MerkleTree::FindLeaf(const FieldElement& value) const {
    for (uint64_t i = 0; i < leafCount_; ++i) {
        if (nodes_[Offset(depth_, i)] == value) {
            return i;
        }
    }
    return std::nullopt;
}

bool MerkleTree::Verify(const FieldElement& leaf, const MerklePath& path) const {
    return Verify(hasher_, depth_, Root(), leaf, path);
}

FieldElement MerkleTree::ComputeRoot(const MerkleHasher& hasher,
                                     const FieldElement& leaf,
                                     const MerklePath& path) {
    if (path.siblings.size() != path.directions.size()) {
        throw MerkleError(MerkleError::Kind::PathLengthMismatch,
                          "path has " + std::to_string(path.siblings.size()) +
                          " siblings and " + std::to_string(path.directions.size()) +
                          " direction bits");
    }

    FieldElement current = leaf;
    for (size_t i = 0; i < path.siblings.size(); ++i) {
        current = path.directions[i] ? hasher.HashNode(path.siblings[i], current)
                                     : hasher.HashNode(current, path.siblings[i]);
    }
    return current;
}

bool MerkleTree::Verify(const MerkleHasher& hasher, size_t depth,
                        const FieldElement& root,
                        const FieldElement& leaf,
                        const MerklePath& path) {
    if (path.Depth() != depth) {
        throw MerkleError(MerkleError::Kind::PathLengthMismatch,
                          "path has " + std::to_string(path.Depth()) +
                          " levels, tree depth is " + std::to_string(depth));
    }
    return ComputeRoot(hasher, leaf, path) == root;
}

std::string MerkleTree::Describe() const {
    constexpr uint64_t FULL_LISTING_LIMIT = 16;
    constexpr uint64_t TRUNCATED_LISTING = 4;

    auto shortHex = [](const FieldElement& fe) {
        return fe.ToHex().substr(0, 8) + "...";
    };

    std::ostringstream oss;
    oss << "Root: " << shortHex(Root()) << "\n";
    oss << "Depth: " << depth_ << "\n";
    oss << "Leaves: " << leafCount_ << " of " << Capacity() << "\n";

    uint64_t shown = leafCount_;
    if (leafCount_ > FULL_LISTING_LIMIT) {
        oss << "(showing first " << TRUNCATED_LISTING << " leaves)\n";
        shown = TRUNCATED_LISTING;
    }
    for (uint64_t i = 0; i < shown; ++i) {
        oss << "Leaf " << i << ": " << shortHex(nodes_[Offset(depth_, i)]) << "\n";
    }
    if (shown < leafCount_) {
        oss << "...\n";
    }
    return oss.str();
}

} // namespace zkanchor
