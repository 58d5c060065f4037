// ZKANCHOR - Anchor Derivation
// Copyright (c) 2024 ZKANCHOR Developers
// MIT License
//
// The anchor binds a proof to one tree root, one range and one consumer:
//   anchor = Poseidon_5(root, lo, hi, tag; ANCHOR domain)
// Verifiers always recompute it from the root and range they trust.

#ifndef ZKANCHOR_PROTOCOL_ANCHOR_H
#define ZKANCHOR_PROTOCOL_ANCHOR_H

#include "zkanchor/crypto/field.h"
#include "zkanchor/crypto/poseidon.h"

namespace zkanchor {
namespace protocol {

/// Capacity label of the anchor hash
constexpr const char* ANCHOR_DOMAIN_LABEL = "zkanchor.anchor";

/// Poseidon instance and capacity tag used for anchors
class AnchorHasher {
public:
    explicit AnchorHasher(const PrimeField& field);

    const Poseidon& Permutation() const { return poseidon_; }
    const FieldElement& Domain() const { return domain_; }

    FieldElement Derive(const FieldElement& root,
                        const FieldElement& lo,
                        const FieldElement& hi,
                        const FieldElement& tag) const;

private:
    Poseidon poseidon_;
    FieldElement domain_;
};

/// Pure anchor derivation. Throws ConfigError::ParameterMismatch if the
/// inputs do not share one field.
FieldElement DeriveAnchor(const FieldElement& root,
                          const FieldElement& lo,
                          const FieldElement& hi,
                          const FieldElement& tag);

/// Throws AnchorMismatch if `claimed` differs from the recomputed anchor
void RequireAnchor(const FieldElement& claimed,
                   const FieldElement& root,
                   const FieldElement& lo,
                   const FieldElement& hi,
                   const FieldElement& tag);

} // namespace protocol
} // namespace zkanchor

#endif // ZKANCHOR_PROTOCOL_ANCHOR_H
