// ZKANCHOR - Transparent Development Backend
// Copyright (c) 2024 ZKANCHOR Developers
// MIT License
//
// A proof backend with no cryptography of its own. The blob carries the
// circuit shape digest and the private part of the assignment, and
// verification re-checks R1CS satisfaction under the verifier's public
// inputs. It binds proofs exactly like a succinct backend would, but it is
// NOT zero-knowledge: the blob reveals the leaf and its path. Use it for
// tests and integration only.

#ifndef ZKANCHOR_BACKEND_TRANSPARENT_H
#define ZKANCHOR_BACKEND_TRANSPARENT_H

#include "zkanchor/backend/backend.h"

namespace zkanchor {
namespace backend {

class TransparentBackend : public ProofBackend {
public:
    TransparentBackend() = default;

    ProofSystem System() const override { return ProofSystem::Transparent; }

    /// Blob: shape digest (32) | private count (LE32) | private values
    ByteVector Prove(const circuit::ConstraintSystem& cs,
                     const std::vector<FieldElement>& assignment) const override;

    BackendVerdict Verify(const circuit::ConstraintSystem& cs,
                          const std::vector<FieldElement>& publicInputs,
                          const ByteVector& blob) const override;
};

} // namespace backend
} // namespace zkanchor

#endif // ZKANCHOR_BACKEND_TRANSPARENT_H
