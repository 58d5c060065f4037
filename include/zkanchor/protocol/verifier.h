// ZKANCHOR - Native Verifier
// Copyright (c) 2024 ZKANCHOR Developers
// MIT License
//
// Direct re-implementation of the anchored range relation over field
// elements. It gates proof generation and serves as the reference the
// circuit is tested against; it never touches a proving backend.

#ifndef ZKANCHOR_PROTOCOL_VERIFIER_H
#define ZKANCHOR_PROTOCOL_VERIFIER_H

#include <string>

#include "zkanchor/merkle/merkle_tree.h"
#include "zkanchor/protocol/anchor.h"
#include "zkanchor/protocol/params.h"
#include "zkanchor/protocol/range.h"
#include "zkanchor/protocol/witness.h"

namespace zkanchor {
namespace protocol {

/// Why a well-formed witness failed the relation
enum class CheckFailure {
    None,
    NonBooleanDirection,
    AnchorMismatch,
    NonBooleanBit,
    LowGapMismatch,
    HighGapMismatch
};

const char* CheckFailureToString(CheckFailure failure);

struct CheckResult {
    bool ok{false};
    CheckFailure failure{CheckFailure::None};
    std::string detail;

    static CheckResult Success() {
        return {true, CheckFailure::None, ""};
    }

    static CheckResult Failure(CheckFailure reason, const std::string& detail) {
        return {false, reason, detail};
    }

    explicit operator bool() const { return ok; }
};

class NativeVerifier {
public:
    explicit NativeVerifier(const ProtocolParams& params);

    const ProtocolParams& Params() const { return params_; }

    /**
     * Check the witness against the public tuple: recompute the root from
     * leaf and path, the anchor from (root, lo, hi, tag), and both gap
     * decompositions.
     *
     * Returns a failed result for a witness that does not satisfy the
     * relation. Throws WitnessError::ShapeMismatch if the witness was built
     * for another depth or width, RangeError::InvalidQuery for a malformed
     * public range, and ConfigError::ParameterMismatch for another field.
     */
    CheckResult Check(const PublicInputs& publicInputs, const Witness& witness) const;

private:
    ProtocolParams params_;
    MerkleHasher merkleHasher_;
    AnchorHasher anchorHasher_;
    RangeEncoder encoder_;
};

} // namespace protocol
} // namespace zkanchor

#endif // ZKANCHOR_PROTOCOL_VERIFIER_H
