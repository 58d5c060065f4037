// ZKANCHOR - Proving Backend Interface
// Copyright (c) 2024 ZKANCHOR Developers
// MIT License
//
// Capability boundary between the anchored range protocol and a proof
// system. A backend turns a satisfied constraint system into an opaque
// blob and later decides whether a blob is valid for given public inputs.

#ifndef ZKANCHOR_BACKEND_BACKEND_H
#define ZKANCHOR_BACKEND_BACKEND_H

#include <cstdint>
#include <string>
#include <vector>

#include "zkanchor/circuit/r1cs.h"
#include "zkanchor/core/types.h"
#include "zkanchor/crypto/field.h"

namespace zkanchor {
namespace backend {

/// Proof system identifier carried in every serialized proof
enum class ProofSystem : uint8_t {
    /// Development backend: blob is the private assignment, not zero-knowledge
    Transparent = 1,

    /// Groth16 (circuit-specific trusted setup)
    Groth16 = 2,

    /// PLONK (universal setup)
    PLONK = 3
};

const char* ProofSystemToString(ProofSystem system);

/// True for identifiers this build knows about
bool IsKnownProofSystem(uint8_t id);

/// Outcome of backend verification
struct BackendVerdict {
    bool accepted{false};
    std::string reason;

    static BackendVerdict Accept() { return {true, ""}; }
    static BackendVerdict Reject(const std::string& why) { return {false, why}; }

    explicit operator bool() const { return accepted; }
};

class ProofBackend {
public:
    virtual ~ProofBackend() = default;

    virtual ProofSystem System() const = 0;

    /// Produce a proof blob for a full assignment [1, public..., private...].
    /// Throws WitnessError::Unsatisfied if the assignment violates `cs`.
    virtual ByteVector Prove(const circuit::ConstraintSystem& cs,
                             const std::vector<FieldElement>& assignment) const = 0;

    /// Decide a blob against the verifier's public inputs (without the
    /// leading one). Invalid blobs are rejected, not thrown.
    virtual BackendVerdict Verify(const circuit::ConstraintSystem& cs,
                                  const std::vector<FieldElement>& publicInputs,
                                  const ByteVector& blob) const = 0;
};

} // namespace backend
} // namespace zkanchor

#endif // ZKANCHOR_BACKEND_BACKEND_H
