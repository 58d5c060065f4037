// ZKANCHOR - Anchor Derivation Implementation
// Copyright (c) 2024 ZKANCHOR Developers
// MIT License

#include "zkanchor/protocol/anchor.h"

#include "zkanchor/core/errors.h"
#include "zkanchor/util/logging.h"

namespace zkanchor {
namespace protocol {

AnchorHasher::AnchorHasher(const PrimeField& field)
    : poseidon_(field, PoseidonParams::CONFIG_4_1)
    , domain_(PoseidonDomain(field, ANCHOR_DOMAIN_LABEL)) {}

FieldElement AnchorHasher::Derive(const FieldElement& root,
                                  const FieldElement& lo,
                                  const FieldElement& hi,
                                  const FieldElement& tag) const {
    const PrimeField& field = poseidon_.Field();
    for (const FieldElement* input : {&root, &lo, &hi, &tag}) {
        if (input->Field() != field) {
            throw ConfigError(ConfigError::Kind::ParameterMismatch,
                              "anchor input belongs to the " + input->Field().Name() +
                              " field, expected " + field.Name());
        }
    }
    return poseidon_.Hash(domain_, {root, lo, hi, tag});
}

FieldElement DeriveAnchor(const FieldElement& root,
                          const FieldElement& lo,
                          const FieldElement& hi,
                          const FieldElement& tag) {
    return AnchorHasher(root.Field()).Derive(root, lo, hi, tag);
}

void RequireAnchor(const FieldElement& claimed,
                   const FieldElement& root,
                   const FieldElement& lo,
                   const FieldElement& hi,
                   const FieldElement& tag) {
    FieldElement expected = DeriveAnchor(root, lo, hi, tag);
    if (claimed != expected) {
        LOG_DEBUG(util::LogCategory::ANCHOR) << "Anchor mismatch: claimed "
            << claimed.ToHex() << ", recomputed " << expected.ToHex();
        throw AnchorMismatch("claimed anchor 0x" + claimed.ToHex() +
                             " does not match root 0x" + root.ToHex() +
                             " and range [" + lo.ToHex() + ", " + hi.ToHex() + "]");
    }
}

} // namespace protocol
} // namespace zkanchor
