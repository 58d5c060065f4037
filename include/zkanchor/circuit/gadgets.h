// ZKANCHOR - Circuit Gadgets
// Copyright (c) 2024 ZKANCHOR Developers
// MIT License
//
// Reusable constraint fragments. Each gadget takes its inputs as linear
// combinations, allocates the auxiliary variables it needs (computing their
// values when the builder is in value mode) and returns its output as a
// linear combination.

#ifndef ZKANCHOR_CIRCUIT_GADGETS_H
#define ZKANCHOR_CIRCUIT_GADGETS_H

#include <string>
#include <vector>

#include "zkanchor/circuit/r1cs.h"
#include "zkanchor/crypto/poseidon.h"

namespace zkanchor {
namespace circuit {

/// x * (x - 1) = 0
void EnforceBoolean(CircuitBuilder& builder, const LinearCombination& x,
                    const std::string& annotation);

/// lhs * 1 = rhs
void EnforceEqual(CircuitBuilder& builder, const LinearCombination& lhs,
                  const LinearCombination& rhs, const std::string& annotation);

/// x^5 with three multiplication constraints (x^2, x^4, x^5)
LinearCombination PoseidonSboxGadget(CircuitBuilder& builder,
                                     const LinearCombination& x,
                                     const std::string& annotation);

/// In-circuit Poseidon permutation mirroring Poseidon::Permute
std::vector<LinearCombination> PoseidonPermutationGadget(
    CircuitBuilder& builder,
    const PoseidonConstants& constants,
    std::vector<LinearCombination> state,
    const std::string& annotation);

/// Fixed-arity compression mirroring Poseidon::Hash
LinearCombination PoseidonHashGadget(CircuitBuilder& builder,
                                     const PoseidonConstants& constants,
                                     const FieldElement& domain,
                                     const std::vector<LinearCombination>& inputs,
                                     const std::string& annotation);

/**
 * One Merkle level: with t = direction * (sibling - current),
 * left = current + t and right = sibling - t, output H_node(left, right).
 * The direction is constrained boolean.
 */
LinearCombination MerkleLevelGadget(CircuitBuilder& builder,
                                    const PoseidonConstants& nodeConstants,
                                    const FieldElement& nodeDomain,
                                    const LinearCombination& current,
                                    const LinearCombination& sibling,
                                    const LinearCombination& direction,
                                    const std::string& annotation);

/// Fold a leaf through every level of its path
LinearCombination MerkleRootGadget(CircuitBuilder& builder,
                                   const PoseidonConstants& nodeConstants,
                                   const FieldElement& nodeDomain,
                                   const LinearCombination& leaf,
                                   const std::vector<Variable>& siblings,
                                   const std::vector<Variable>& directions);

/// Booleanity of every bit plus sum(bit_i * 2^i) = target
void BitPackingGadget(CircuitBuilder& builder,
                      const std::vector<Variable>& bits,
                      const LinearCombination& target,
                      const std::string& annotation);

/// lo <= value <= hi through the two B-bit gap decompositions
void RangeGadget(CircuitBuilder& builder,
                 const LinearCombination& value,
                 const LinearCombination& lo,
                 const LinearCombination& hi,
                 const std::vector<Variable>& lowBits,
                 const std::vector<Variable>& highBits);

} // namespace circuit
} // namespace zkanchor

#endif // ZKANCHOR_CIRCUIT_GADGETS_H
