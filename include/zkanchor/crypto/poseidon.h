// ZKANCHOR - Poseidon Hash Function
// Copyright (c) 2024 ZKANCHOR Developers
// MIT License
//
// ZK-friendly algebraic hash over a PrimeField.
// Based on: "Poseidon: A New Hash Function for Zero-Knowledge Proof Systems"
// https://eprint.iacr.org/2019/458
//
// Used here as a fixed-arity compression function: the rate part of the
// state holds exactly `rate` inputs, the capacity element holds a domain
// tag, one permutation is applied and state[0] is the output. Distinct
// domain tags give independent functions for each usage site.

#ifndef ZKANCHOR_CRYPTO_POSEIDON_H
#define ZKANCHOR_CRYPTO_POSEIDON_H

#include <cstdint>
#include <string>
#include <vector>

#include "zkanchor/crypto/field.h"

namespace zkanchor {

// ============================================================================
// Poseidon Configuration
// ============================================================================

struct PoseidonConfig {
    /// State width (t)
    size_t width;

    /// Number of full rounds (R_F), split evenly around the partial rounds
    size_t fullRounds;

    /// Number of partial rounds (R_P)
    size_t partialRounds;

    size_t capacity;

    size_t rate() const { return width - capacity; }
    size_t totalRounds() const { return fullRounds + partialRounds; }

    bool operator==(const PoseidonConfig& other) const {
        return width == other.width && fullRounds == other.fullRounds &&
               partialRounds == other.partialRounds && capacity == other.capacity;
    }
    bool operator!=(const PoseidonConfig& other) const { return !(*this == other); }
};

namespace PoseidonParams {
    /// 2-to-1 compression (width=3, capacity=1, rate=2), Merkle nodes
    extern const PoseidonConfig CONFIG_2_1;

    /// 4-to-1 compression (width=5, capacity=1, rate=4), anchors
    extern const PoseidonConfig CONFIG_4_1;
}

// ============================================================================
// Poseidon Constants
// ============================================================================

/// Round constants and MDS matrix for one (field, config) pair.
/// Derived once and shared read-only for the life of the process.
struct PoseidonConstants {
    const PrimeField* field;
    PoseidonConfig config;

    /// roundConstants[round][lane]
    std::vector<std::vector<FieldElement>> roundConstants;

    /// mds[row][col], Cauchy matrix 1 / (row + width + col)
    std::vector<std::vector<FieldElement>> mds;

    /// Throws ConfigError::InvalidParameter if x^5 is not a permutation of
    /// the field or the field is too small for the MDS construction.
    static const PoseidonConstants& For(const PrimeField& field,
                                        const PoseidonConfig& config);
};

/// Domain tag from an ASCII label of at most 31 bytes, embedded as a
/// little-endian integer (reduced modulo p for narrow test fields).
FieldElement PoseidonDomain(const PrimeField& field, const std::string& label);

// ============================================================================
// Poseidon Hash Class
// ============================================================================

class Poseidon {
public:
    Poseidon(const PrimeField& field, const PoseidonConfig& config);

    const PrimeField& Field() const { return *constants_->field; }
    const PoseidonConfig& Config() const { return constants_->config; }
    const PoseidonConstants& Constants() const { return *constants_; }

    /// Apply the permutation to a state of `width` elements
    void Permute(std::vector<FieldElement>& state) const;

    /// Compress exactly rate() inputs under `domain`
    FieldElement Hash(const FieldElement& domain,
                      const std::vector<FieldElement>& inputs) const;

    /// Two-input compression (requires rate() == 2)
    FieldElement Hash2(const FieldElement& domain,
                       const FieldElement& left,
                       const FieldElement& right) const;

private:
    const PoseidonConstants* constants_;

    void FullRound(std::vector<FieldElement>& state, size_t roundIdx) const;
    void PartialRound(std::vector<FieldElement>& state, size_t roundIdx) const;
    void AddRoundConstants(std::vector<FieldElement>& state, size_t roundIdx) const;
    void MixColumns(std::vector<FieldElement>& state) const;
};

} // namespace zkanchor

#endif // ZKANCHOR_CRYPTO_POSEIDON_H
