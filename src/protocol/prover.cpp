// ZKANCHOR - Anchored Proof Generation and Verification Implementation
// Copyright (c) 2024 ZKANCHOR Developers
// MIT License

#include "zkanchor/protocol/prover.h"

#include "zkanchor/core/errors.h"
#include "zkanchor/protocol/anchor.h"
#include "zkanchor/util/logging.h"
#include "zkanchor/util/threadpool.h"

namespace zkanchor {
namespace protocol {

namespace {

std::shared_ptr<const backend::ProofBackend> RequireBackend(
        std::shared_ptr<const backend::ProofBackend> backend) {
    if (!backend) {
        throw ConfigError(ConfigError::Kind::InvalidParameter, "no proof backend");
    }
    return backend;
}

} // namespace

// ============================================================================
// AnchoredProver
// ============================================================================

AnchoredProver::AnchoredProver(const ProtocolParams& params,
                               std::shared_ptr<const backend::ProofBackend> backend)
    : params_(params)
    , backend_(RequireBackend(std::move(backend)))
    , circuit_(params)
    , encoder_(params)
    , assembler_(params)
    , native_(params) {}

MerkleTree AnchoredProver::BuildTree(const std::vector<FieldElement>& leaves) const {
    std::shared_ptr<util::ThreadPool> pool = params_.BuildPool();
    LOG_DEBUG(util::LogCategory::PROVER) << "Building depth " << params_.Depth()
        << " tree over " << leaves.size() << " leaves on pool '" << pool->Name()
        << "' (" << pool->ThreadCount() << " workers)";
    return MerkleTree::Build(params_.Field(), leaves, params_.Depth(), *pool);
}

std::pair<PublicInputs, Witness> AnchoredProver::Prepare(const MerkleTree& tree,
                                                         uint64_t index,
                                                         const FieldElement& lo,
                                                         const FieldElement& hi) const {
    if (tree.Field() != params_.Field() || tree.Depth() != params_.Depth()) {
        throw ConfigError(ConfigError::Kind::ParameterMismatch,
                          "tree (" + tree.Field().Name() + ", depth " +
                          std::to_string(tree.Depth()) + ") does not match " +
                          params_.ToString());
    }

    const FieldElement& value = tree.Leaf(index);
    MerklePath path = tree.PathFor(index);
    RangeWitness range = encoder_.Encode(value, lo, hi);

    FieldElement anchor = DeriveAnchor(tree.Root(), lo, hi, params_.DomainTag());
    Witness witness = assembler_.Assemble(value, path, range);

    return {PublicInputs{anchor, lo, hi}, std::move(witness)};
}

backend::Proof AnchoredProver::Prove(const MerkleTree& tree, uint64_t index,
                                     const FieldElement& lo,
                                     const FieldElement& hi) const {
    ZKANCHOR_LOG_TIMER(util::LogCategory::PROVER, "Anchored prove");

    std::pair<PublicInputs, Witness> prepared = Prepare(tree, index, lo, hi);
    const PublicInputs& publicInputs = prepared.first;
    const Witness& witness = prepared.second;

    CheckResult check = native_.Check(publicInputs, witness);
    if (!check.ok) {
        throw WitnessError(WitnessError::Kind::Unsatisfied,
                           std::string("native check failed: ") +
                           CheckFailureToString(check.failure) + " (" +
                           check.detail + ")");
    }

    std::vector<FieldElement> assignment = circuit_.Assign(publicInputs, witness);
    ByteVector blob = backend_->Prove(circuit_.System(), assignment);

    LOG_INFO(util::LogCategory::PROVER) << "Proved leaf " << index << " in range under root 0x"
        << tree.Root().ToHex() << " with the "
        << backend::ProofSystemToString(backend_->System()) << " backend";

    return backend::Proof(backend_->System(), params_.Stamp(), publicInputs,
                          std::move(blob));
}

// ============================================================================
// AnchoredVerifier
// ============================================================================

const char* VerificationResultToString(VerificationResult result) {
    switch (result) {
        case VerificationResult::Accepted: return "accepted";
        case VerificationResult::RangeMismatch: return "range mismatch";
        case VerificationResult::AnchorMismatch: return "anchor mismatch";
        case VerificationResult::BackendRejected: return "backend rejected";
        case VerificationResult::WrongProofSystem: return "wrong proof system";
        default: return "unknown";
    }
}

AnchoredVerifier::AnchoredVerifier(const ProtocolParams& params,
                                   std::shared_ptr<const backend::ProofBackend> backend)
    : params_(params)
    , backend_(RequireBackend(std::move(backend)))
    , circuit_(params)
    , encoder_(params)
    , anchorHasher_(params.Field()) {}

VerificationResult AnchoredVerifier::Verify(const backend::Proof& proof,
                                            const FieldElement& claimedRoot,
                                            const FieldElement& lo,
                                            const FieldElement& hi) const {
    params_.RequireCompatible(proof.Stamp());
    if (claimedRoot.Field() != params_.Field()) {
        throw ConfigError(ConfigError::Kind::ParameterMismatch,
                          "claimed root belongs to a different field");
    }
    encoder_.ValidateQuery(lo, hi);

    auto reject = [](VerificationResult result, const std::string& detail) {
        LOG_INFO(util::LogCategory::VERIFY) << "Proof rejected: "
            << VerificationResultToString(result) << " (" << detail << ")";
        return result;
    };

    if (proof.System() != backend_->System()) {
        return reject(VerificationResult::WrongProofSystem,
                      std::string(backend::ProofSystemToString(proof.System())) +
                      " proof given to a " +
                      backend::ProofSystemToString(backend_->System()) + " verifier");
    }

    const PublicInputs& publicInputs = proof.Public();
    if (publicInputs.lo != lo || publicInputs.hi != hi) {
        return reject(VerificationResult::RangeMismatch,
                      "proof covers [0x" + publicInputs.lo.ToHex() + ", 0x" +
                      publicInputs.hi.ToHex() + "]");
    }

    FieldElement expected = anchorHasher_.Derive(claimedRoot, lo, hi, params_.DomainTag());
    if (publicInputs.anchor != expected) {
        return reject(VerificationResult::AnchorMismatch,
                      "proof anchor is not bound to root 0x" + claimedRoot.ToHex());
    }

    backend::BackendVerdict verdict =
        backend_->Verify(circuit_.System(), {expected, lo, hi}, proof.Blob());
    if (!verdict.accepted) {
        return reject(VerificationResult::BackendRejected, verdict.reason);
    }

    LOG_DEBUG(util::LogCategory::VERIFY) << "Proof accepted for root 0x"
        << claimedRoot.ToHex();
    return VerificationResult::Accepted;
}

} // namespace protocol
} // namespace zkanchor
