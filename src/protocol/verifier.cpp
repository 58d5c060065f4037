// ZKANCHOR - Native Verifier Implementation
// Copyright (c) 2024 ZKANCHOR Developers
// MIT License

#include "zkanchor/protocol/verifier.h"

#include "zkanchor/core/errors.h"
#include "zkanchor/util/logging.h"

namespace zkanchor {
namespace protocol {

const char* CheckFailureToString(CheckFailure failure) {
    switch (failure) {
        case CheckFailure::None: return "none";
        case CheckFailure::NonBooleanDirection: return "non-boolean direction";
        case CheckFailure::AnchorMismatch: return "anchor mismatch";
        case CheckFailure::NonBooleanBit: return "non-boolean bit";
        case CheckFailure::LowGapMismatch: return "low gap mismatch";
        case CheckFailure::HighGapMismatch: return "high gap mismatch";
        default: return "unknown";
    }
}

NativeVerifier::NativeVerifier(const ProtocolParams& params)
    : params_(params)
    , merkleHasher_(params.Field())
    , anchorHasher_(params.Field())
    , encoder_(params) {}

CheckResult NativeVerifier::Check(const PublicInputs& publicInputs,
                                  const Witness& witness) const {
    if (witness.Depth() != params_.Depth() ||
        witness.RangeBits() != params_.RangeBits() ||
        witness.Size() != Witness::SizeFor(params_.Depth(), params_.RangeBits())) {
        throw WitnessError(WitnessError::Kind::ShapeMismatch,
                           "witness shape (D=" + std::to_string(witness.Depth()) +
                           ", B=" + std::to_string(witness.RangeBits()) +
                           ") does not match parameters (D=" +
                           std::to_string(params_.Depth()) + ", B=" +
                           std::to_string(params_.RangeBits()) + ")");
    }
    if (witness.Field() != params_.Field() ||
        publicInputs.anchor.Field() != params_.Field()) {
        throw ConfigError(ConfigError::Kind::ParameterMismatch,
                          "inputs belong to a different field");
    }
    encoder_.ValidateQuery(publicInputs.lo, publicInputs.hi);

    auto fail = [](CheckFailure reason, const std::string& detail) {
        LOG_DEBUG(util::LogCategory::VERIFY) << "Native check failed: "
            << CheckFailureToString(reason) << " (" << detail << ")";
        return CheckResult::Failure(reason, detail);
    };

    MerklePath path;
    path.siblings = witness.Siblings();
    for (size_t level = 0; level < witness.Depth(); ++level) {
        const FieldElement& direction = witness.Direction(level);
        if (!direction.IsZero() && !direction.IsOne()) {
            return fail(CheckFailure::NonBooleanDirection,
                        "level " + std::to_string(level));
        }
        path.directions.push_back(direction.IsOne());
    }

    FieldElement root = MerkleTree::ComputeRoot(merkleHasher_, witness.Leaf(), path);
    FieldElement anchor = anchorHasher_.Derive(root, publicInputs.lo, publicInputs.hi,
                                               params_.DomainTag());
    if (anchor != publicInputs.anchor) {
        return fail(CheckFailure::AnchorMismatch,
                    "recomputed 0x" + anchor.ToHex() + ", public 0x" +
                    publicInputs.anchor.ToHex());
    }

    BitDecomposition low = witness.LowBits();
    BitDecomposition high = witness.HighBits();
    if (!low.IsBoolean() || !high.IsBoolean()) {
        return fail(CheckFailure::NonBooleanBit,
                    !low.IsBoolean() ? "low decomposition" : "high decomposition");
    }
    if (low.Reconstruct() != witness.Leaf() - publicInputs.lo) {
        return fail(CheckFailure::LowGapMismatch, "bits do not sum to value - lo");
    }
    if (high.Reconstruct() != publicInputs.hi - witness.Leaf()) {
        return fail(CheckFailure::HighGapMismatch, "bits do not sum to hi - value");
    }

    return CheckResult::Success();
}

} // namespace protocol
} // namespace zkanchor
