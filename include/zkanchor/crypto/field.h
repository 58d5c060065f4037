// ZKANCHOR - Finite Field Arithmetic
// Copyright (c) 2024 ZKANCHOR Developers
// MIT License
//
// Implements arithmetic over prime fields for Poseidon hashing, Merkle
// commitments and the anchored range circuit. The modulus is a runtime
// value carried by PrimeField; named instances exist for the BN254 and
// BLS12-381 scalar fields.

#ifndef ZKANCHOR_CRYPTO_FIELD_H
#define ZKANCHOR_CRYPTO_FIELD_H

#include <cstdint>
#include <array>
#include <string>
#include <utility>
#include <vector>

#include "zkanchor/core/types.h"

namespace zkanchor {

// ============================================================================
// 256-bit Unsigned Integer (for field arithmetic)
// ============================================================================

/// 256-bit unsigned integer represented as 4 x 64-bit limbs (little-endian)
class Uint256 {
public:
    static constexpr size_t NUM_LIMBS = 4;

    /// Limbs in little-endian order (limb[0] is least significant)
    std::array<uint64_t, NUM_LIMBS> limbs;

    /// Default constructor - zero
    constexpr Uint256() : limbs{0, 0, 0, 0} {}

    /// Construct from limbs (little-endian)
    constexpr Uint256(uint64_t l0, uint64_t l1, uint64_t l2, uint64_t l3)
        : limbs{l0, l1, l2, l3} {}

    /// Construct from single value
    explicit constexpr Uint256(uint64_t val) : limbs{val, 0, 0, 0} {}

    /// Construct from little-endian bytes (at most 32 are read)
    explicit Uint256(const Byte* data, size_t len);

    /// Parse big-endian hex (optional 0x prefix, at most 64 digits)
    static Uint256 FromHex(const std::string& hex);

    /// Convert to 64-digit big-endian hex string
    std::string ToHex() const;

    /// Convert to byte array (little-endian, 32 bytes)
    std::array<Byte, 32> ToBytes() const;

    bool IsZero() const;

    /// Number of significant bits (0 for zero)
    size_t BitLength() const;

    /// Value of bit i (little-endian numbering)
    bool TestBit(size_t i) const;

    /// Remainder modulo a small non-zero divisor
    uint64_t ModSmall(uint64_t divisor) const;

    /// Comparison operators
    bool operator==(const Uint256& other) const;
    bool operator!=(const Uint256& other) const;
    bool operator<(const Uint256& other) const;
    bool operator<=(const Uint256& other) const;
    bool operator>(const Uint256& other) const;
    bool operator>=(const Uint256& other) const;

    Uint256 operator<<(int shift) const;
    Uint256 operator>>(int shift) const;

    /// Arithmetic operations (modular arithmetic done in PrimeField)
    static Uint256 Add(const Uint256& a, const Uint256& b, bool& carry);
    static Uint256 Sub(const Uint256& a, const Uint256& b, bool& borrow);
    static Uint256 Mul(const Uint256& a, const Uint256& b, Uint256& high);
};

class FieldElement;

// ============================================================================
// Prime Field
// ============================================================================

/// A prime field F_p with its Montgomery constants.
///
/// Instances are interned per modulus and live for the whole process, so
/// references and pointers to them never dangle and identity comparison is
/// modulus comparison. Constants are derived at construction time.
class PrimeField {
public:
    /// Interned field for the given modulus.
    /// Throws ConfigError::InvalidParameter unless the modulus is an odd
    /// prime greater than 3 with at most 255 bits.
    static const PrimeField& Get(const Uint256& modulus);

    /// BN254 scalar field (254 bits)
    static const PrimeField& BN254Scalar();

    /// BLS12-381 scalar field (255 bits)
    static const PrimeField& BLS12_381Scalar();

    /// Lookup by name: "bn254" or "bls12_381"
    static const PrimeField& FromName(const std::string& name);

    /// Number of fields interned so far
    static size_t RegisteredCount();

    PrimeField(const PrimeField&) = delete;
    PrimeField& operator=(const PrimeField&) = delete;

    const Uint256& Modulus() const { return modulus_; }
    const std::string& Name() const { return name_; }

    /// Bit length of p
    size_t BitLength() const { return bitLength_; }

    /// Canonical encoding width: ceil(bitlen(p) / 8)
    size_t ByteWidth() const { return byteWidth_; }

    bool operator==(const PrimeField& other) const { return this == &other; }
    bool operator!=(const PrimeField& other) const { return this != &other; }

    // ========================================================================
    // Element constructors
    // ========================================================================

    FieldElement Zero() const;
    FieldElement One() const;

    /// Embed a small integer (throws FieldError::NonCanonical if >= p)
    FieldElement FromUint64(uint64_t val) const;

    /// Embed an integer (throws FieldError::NonCanonical if >= p)
    FieldElement FromUint256(const Uint256& val) const;

    /// Embed an integer reduced modulo p
    FieldElement Reduce(const Uint256& val) const;

    /// Canonical decoding: exactly ByteWidth() little-endian bytes, value < p
    FieldElement FromBytes(const Byte* data, size_t len) const;
    FieldElement FromBytes(const ByteVector& data) const;

    /// Reducing decoding of arbitrary-length little-endian bytes.
    /// Only for deriving constants from hash output.
    FieldElement FromBytesReduce(const Byte* data, size_t len) const;

    /// Parse big-endian hex (canonical, throws like FromUint256)
    FieldElement FromHex(const std::string& hex) const;

    /// Uniformly random element (OpenSSL RAND_bytes, rejection sampling)
    FieldElement Random() const;

private:
    friend class FieldElement;

    PrimeField(const Uint256& modulus, std::string name);

    Uint256 ModAdd(const Uint256& a, const Uint256& b) const;
    Uint256 ModSub(const Uint256& a, const Uint256& b) const;
    Uint256 MontMul(const Uint256& a, const Uint256& b) const;
    Uint256 MontReduce(const Uint256& lo, const Uint256& hi) const;
    Uint256 MontPow(const Uint256& base, const Uint256& exp) const;

    /// Montgomery form of any integer, reduced modulo p
    Uint256 ToMont(const Uint256& val) const;
    Uint256 FromMont(const Uint256& val) const;

    Uint256 modulus_;
    Uint256 r_;      ///< 2^256 mod p (Montgomery one)
    Uint256 r2_;     ///< R^2 mod p
    uint64_t inv_;   ///< -p^(-1) mod 2^64
    size_t bitLength_;
    size_t byteWidth_;
    std::string name_;
};

// ============================================================================
// Field Element
// ============================================================================

/// Element of a PrimeField, held in Montgomery form.
///
/// Elements are values: every operation returns a new element. Arithmetic
/// between elements of different fields throws
/// ConfigError::ParameterMismatch; equality across fields is false.
class FieldElement {
public:
    FieldElement(const FieldElement&) = default;
    FieldElement& operator=(const FieldElement&) = default;

    const PrimeField& Field() const { return *field_; }

    /// Standard (non-Montgomery) representation
    Uint256 ToUint256() const;

    /// Value as uint64_t (throws FieldError::Overflow if it does not fit)
    uint64_t ToUint64() const;

    /// Canonical little-endian encoding of ByteWidth() bytes
    ByteVector ToBytes() const;

    /// Big-endian hex of ByteWidth() bytes
    std::string ToHex() const;

    /// Little-endian 0/1 decomposition of exactly `width` bits.
    /// Throws FieldError::Overflow if the value needs more than `width` bits.
    std::vector<Byte> ToBits(size_t width) const;

    /// Number of significant bits of the standard representation
    size_t BitLength() const;

    bool IsZero() const;
    bool IsOne() const;

    bool operator==(const FieldElement& other) const;
    bool operator!=(const FieldElement& other) const;

    /// Field arithmetic
    FieldElement operator+(const FieldElement& other) const;
    FieldElement operator-(const FieldElement& other) const;
    FieldElement operator*(const FieldElement& other) const;
    FieldElement operator-() const;

    FieldElement Square() const;
    FieldElement Pow(const Uint256& exp) const;
    FieldElement Pow(uint64_t exp) const;

    /// Multiplicative inverse (throws FieldError::NotInvertible on zero)
    FieldElement Inverse() const;

    /// S-box for Poseidon: x^5
    FieldElement PoseidonSbox() const;

private:
    friend class PrimeField;

    FieldElement(const PrimeField* field, const Uint256& mont)
        : field_(field), value_(mont) {}

    void RequireSameField(const FieldElement& other) const;

    const PrimeField* field_;
    Uint256 value_;  ///< Montgomery form
};

// ============================================================================
// Limb Helpers
// ============================================================================

/// Split a 256-bit integer into (low 128 bits, high 128 bits), each embedded
/// as a field element. Requires a field of more than 128 bits.
std::pair<FieldElement, FieldElement> SplitToLimbs(const PrimeField& field,
                                                   const Uint256& value);

/// Inverse of SplitToLimbs (throws FieldError::Overflow if a limb is wider
/// than 128 bits)
Uint256 JoinLimbs(const FieldElement& low, const FieldElement& high);

} // namespace zkanchor

#endif // ZKANCHOR_CRYPTO_FIELD_H
