// ZKANCHOR - Anchored Range Circuit
// Copyright (c) 2024 ZKANCHOR Developers
// MIT License
//
// The relation proven for an anchored range query:
//   public  (anchor, lo, hi)
//   private (leaf, siblings, directions, low bits, high bits)
// such that the leaf and path hash to some root, the anchor equals
// H_anchor(root, lo, hi, tag) and lo <= leaf <= hi.
//
// The circuit shape depends only on the protocol parameters.

#ifndef ZKANCHOR_CIRCUIT_ANCHORED_RANGE_CIRCUIT_H
#define ZKANCHOR_CIRCUIT_ANCHORED_RANGE_CIRCUIT_H

#include <vector>

#include "zkanchor/circuit/r1cs.h"
#include "zkanchor/protocol/params.h"
#include "zkanchor/protocol/witness.h"

namespace zkanchor {
namespace circuit {

class AnchoredRangeCircuit {
public:
    /// Variable indices of the public inputs
    static constexpr size_t ANCHOR_VAR = 1;
    static constexpr size_t LO_VAR = 2;
    static constexpr size_t HI_VAR = 3;

    /// First witness variable
    static constexpr size_t WITNESS_OFFSET = 1 + protocol::PublicInputs::COUNT;

    /// Synthesizes the constraint system for `params`
    explicit AnchoredRangeCircuit(const protocol::ProtocolParams& params);

    const protocol::ProtocolParams& Params() const { return params_; }
    const ConstraintSystem& System() const { return system_; }

    /**
     * Full assignment [1, public..., witness..., aux...] for the inputs.
     * Throws WitnessError::ShapeMismatch if the witness was built for other
     * parameters. The assignment satisfies System() exactly when the
     * inputs satisfy the relation.
     */
    std::vector<FieldElement> Assign(const protocol::PublicInputs& publicInputs,
                                     const protocol::Witness& witness) const;

    /// [1, anchor, lo, hi] prefix of an assignment
    static std::vector<FieldElement> PublicAssignment(const protocol::PublicInputs& publicInputs);

private:
    static ConstraintSystem BuildSystem(const protocol::ProtocolParams& params);

    static void Synthesize(CircuitBuilder& builder,
                           const protocol::ProtocolParams& params,
                           const protocol::PublicInputs* publicInputs,
                           const protocol::Witness* witness);

    protocol::ProtocolParams params_;
    ConstraintSystem system_;
};

} // namespace circuit
} // namespace zkanchor

#endif // ZKANCHOR_CIRCUIT_ANCHORED_RANGE_CIRCUIT_H
