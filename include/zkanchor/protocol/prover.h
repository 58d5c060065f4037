// ZKANCHOR - Anchored Proof Generation and Verification
// Copyright (c) 2024 ZKANCHOR Developers
// MIT License
//
// Entry points tying the pieces together. The prover derives the path,
// anchor and range witness for one leaf, runs the native check as a
// pre-flight gate and hands the circuit assignment to a backend. The
// verifier never trusts the anchor inside a proof: it recomputes it from
// the root and range the caller trusts.

#ifndef ZKANCHOR_PROTOCOL_PROVER_H
#define ZKANCHOR_PROTOCOL_PROVER_H

#include <memory>

#include "zkanchor/backend/backend.h"
#include "zkanchor/backend/proof.h"
#include "zkanchor/circuit/anchored_range_circuit.h"
#include "zkanchor/merkle/merkle_tree.h"
#include "zkanchor/protocol/params.h"
#include "zkanchor/protocol/verifier.h"
#include "zkanchor/protocol/witness.h"

namespace zkanchor {
namespace protocol {

// ============================================================================
// Prover
// ============================================================================

class AnchoredProver {
public:
    AnchoredProver(const ProtocolParams& params,
                   std::shared_ptr<const backend::ProofBackend> backend);

    const ProtocolParams& Params() const { return params_; }
    const circuit::AnchoredRangeCircuit& Circuit() const { return circuit_; }

    /// Commit `leaves` in a tree of the configured field and depth, hashed on
    /// the pool ProtocolParams::BuildPool() selects
    MerkleTree BuildTree(const std::vector<FieldElement>& leaves) const;

    /**
     * Prove that leaf `index` of `tree` lies in [lo, hi], anchored to the
     * tree's root.
     *
     * Throws ConfigError::ParameterMismatch for a tree built with another
     * field or depth, MerkleError::IndexOutOfRange, RangeError::InvalidQuery
     * or RangeError::OutOfRange from encoding, and WitnessError::Unsatisfied
     * if the native pre-flight check rejects the witness.
     */
    backend::Proof Prove(const MerkleTree& tree, uint64_t index,
                         const FieldElement& lo, const FieldElement& hi) const;

    /// Public inputs and witness for a query, without invoking the backend
    std::pair<PublicInputs, Witness> Prepare(const MerkleTree& tree, uint64_t index,
                                             const FieldElement& lo,
                                             const FieldElement& hi) const;

private:
    ProtocolParams params_;
    std::shared_ptr<const backend::ProofBackend> backend_;
    circuit::AnchoredRangeCircuit circuit_;
    RangeEncoder encoder_;
    WitnessAssembler assembler_;
    NativeVerifier native_;
};

// ============================================================================
// Verifier
// ============================================================================

enum class VerificationResult {
    Accepted,
    RangeMismatch,     ///< Proof's public range differs from the claimed one
    AnchorMismatch,    ///< Proof's anchor is not bound to the claimed root
    BackendRejected,
    WrongProofSystem
};

const char* VerificationResultToString(VerificationResult result);

class AnchoredVerifier {
public:
    AnchoredVerifier(const ProtocolParams& params,
                     std::shared_ptr<const backend::ProofBackend> backend);

    const ProtocolParams& Params() const { return params_; }

    /**
     * Decide whether `proof` shows some leaf under `claimedRoot` lies in
     * [lo, hi].
     *
     * Throws ConfigError::ParameterMismatch if the proof was stamped with
     * other parameters and RangeError::InvalidQuery for a malformed claimed
     * range. Every other failure is a rejected result.
     */
    VerificationResult Verify(const backend::Proof& proof,
                              const FieldElement& claimedRoot,
                              const FieldElement& lo,
                              const FieldElement& hi) const;

private:
    ProtocolParams params_;
    std::shared_ptr<const backend::ProofBackend> backend_;
    circuit::AnchoredRangeCircuit circuit_;
    RangeEncoder encoder_;
    AnchorHasher anchorHasher_;
};

} // namespace protocol
} // namespace zkanchor

#endif // ZKANCHOR_PROTOCOL_PROVER_H
