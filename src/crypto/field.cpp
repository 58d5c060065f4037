// ZKANCHOR - Finite Field Arithmetic Implementation
// Copyright (c) 2024 ZKANCHOR Developers
// MIT License
//
// Montgomery arithmetic over a runtime prime modulus. R, R^2 and the
// reduction constant are derived from the modulus when a field is first
// requested, so BN254, BLS12-381 and test fields share one code path.

#include "zkanchor/crypto/field.h"

#include "zkanchor/core/errors.h"
#include "zkanchor/core/hex.h"
#include "zkanchor/util/logging.h"

#include <openssl/bn.h>
#include <openssl/rand.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <map>
#include <memory>
#include <mutex>

namespace zkanchor {

namespace {

// r = 21888242871839275222246405745257275088548364400416034343698204186575808495617
const Uint256 BN254_SCALAR_MODULUS{
    0x43e1f593f0000001ULL,
    0x2833e84879b97091ULL,
    0xb85045b68181585dULL,
    0x30644e72e131a029ULL
};

// r = 52435875175126190479447740508185965837690552500527637822603658699938581184513
const Uint256 BLS12_381_SCALAR_MODULUS{
    0xffffffff00000001ULL,
    0x53bda402fffe5bfeULL,
    0x3339d80809a1d805ULL,
    0x73eda753299d7d48ULL
};

constexpr size_t MAX_MODULUS_BITS = 255;

std::string NameForModulus(const Uint256& modulus) {
    if (modulus == BN254_SCALAR_MODULUS) return "bn254";
    if (modulus == BLS12_381_SCALAR_MODULUS) return "bls12_381";
    return "custom";
}

/// Miller-Rabin via OpenSSL, with the round count BN_check_prime picks for
/// the operand size (error rate below 2^-128).
bool IsProbablePrime(const Uint256& value) {
    auto bytes = value.ToBytes();
    BIGNUM* bn = BN_lebin2bn(bytes.data(), static_cast<int>(bytes.size()), nullptr);
    BN_CTX* ctx = BN_CTX_new();
    if (!bn || !ctx) {
        BN_free(bn);
        BN_CTX_free(ctx);
        throw Error("OpenSSL allocation failed during primality test");
    }

    int result = BN_check_prime(bn, ctx, nullptr);
    BN_CTX_free(ctx);
    BN_free(bn);
    if (result < 0) {
        throw Error("OpenSSL primality test failed");
    }
    return result == 1;
}

/// Registry of interned fields. Entries are never removed.
struct FieldRegistry {
    std::mutex mutex;
    std::map<Uint256, std::unique_ptr<PrimeField>> fields;
};

FieldRegistry& Registry() {
    static FieldRegistry registry;
    return registry;
}

} // namespace

// ============================================================================
// Uint256 Implementation
// ============================================================================

Uint256::Uint256(const Byte* data, size_t len) : limbs{0, 0, 0, 0} {
    size_t n = std::min(len, size_t(32));
    for (size_t i = 0; i < n; ++i) {
        limbs[i / 8] |= static_cast<uint64_t>(data[i]) << ((i % 8) * 8);
    }
}

Uint256 Uint256::FromHex(const std::string& hex) {
    std::string digits = StripHexPrefix(hex);
    if (digits.empty() || digits.size() > 64) {
        throw FieldError(FieldError::Kind::BadEncoding,
                         "hex integer must have 1 to 64 digits");
    }

    Uint256 result;
    for (char c : digits) {
        int nibble = HexCharToNibble(c);
        if (nibble < 0) {
            throw FieldError(FieldError::Kind::BadEncoding,
                             std::string("invalid hex character '") + c + "'");
        }
        result = result << 4;
        result.limbs[0] |= static_cast<uint64_t>(nibble);
    }
    return result;
}

std::string Uint256::ToHex() const {
    auto bytes = ToBytes();
    std::reverse(bytes.begin(), bytes.end());
    return BytesToHex(bytes);
}

std::array<Byte, 32> Uint256::ToBytes() const {
    std::array<Byte, 32> result;
    for (size_t i = 0; i < 32; ++i) {
        result[i] = static_cast<Byte>((limbs[i / 8] >> ((i % 8) * 8)) & 0xFF);
    }
    return result;
}

bool Uint256::IsZero() const {
    return limbs[0] == 0 && limbs[1] == 0 && limbs[2] == 0 && limbs[3] == 0;
}

size_t Uint256::BitLength() const {
    for (int i = 3; i >= 0; --i) {
        if (limbs[i] != 0) {
            return static_cast<size_t>(i) * 64 + 64 -
                   static_cast<size_t>(__builtin_clzll(limbs[i]));
        }
    }
    return 0;
}

bool Uint256::TestBit(size_t i) const {
    if (i >= 256) return false;
    return (limbs[i / 64] >> (i % 64)) & 1;
}

uint64_t Uint256::ModSmall(uint64_t divisor) const {
    __uint128_t rem = 0;
    for (int i = 3; i >= 0; --i) {
        rem = ((rem << 64) | limbs[i]) % divisor;
    }
    return static_cast<uint64_t>(rem);
}

bool Uint256::operator==(const Uint256& other) const {
    return limbs == other.limbs;
}

bool Uint256::operator!=(const Uint256& other) const {
    return !(*this == other);
}

bool Uint256::operator<(const Uint256& other) const {
    for (int i = 3; i >= 0; --i) {
        if (limbs[i] < other.limbs[i]) return true;
        if (limbs[i] > other.limbs[i]) return false;
    }
    return false;
}

bool Uint256::operator<=(const Uint256& other) const {
    return !(other < *this);
}

bool Uint256::operator>(const Uint256& other) const {
    return other < *this;
}

bool Uint256::operator>=(const Uint256& other) const {
    return !(*this < other);
}

Uint256 Uint256::Add(const Uint256& a, const Uint256& b, bool& carry) {
    Uint256 result;
    uint64_t c = 0;

    for (size_t i = 0; i < NUM_LIMBS; ++i) {
        __uint128_t sum = static_cast<__uint128_t>(a.limbs[i]) +
                          static_cast<__uint128_t>(b.limbs[i]) + c;
        result.limbs[i] = static_cast<uint64_t>(sum);
        c = static_cast<uint64_t>(sum >> 64);
    }

    carry = (c != 0);
    return result;
}

Uint256 Uint256::Sub(const Uint256& a, const Uint256& b, bool& borrow) {
    Uint256 result;
    uint64_t bw = 0;

    for (size_t i = 0; i < NUM_LIMBS; ++i) {
        __uint128_t diff = static_cast<__uint128_t>(a.limbs[i]) -
                           static_cast<__uint128_t>(b.limbs[i]) - bw;
        result.limbs[i] = static_cast<uint64_t>(diff);
        bw = static_cast<uint64_t>((diff >> 127) & 1);
    }

    borrow = (bw != 0);
    return result;
}

Uint256 Uint256::Mul(const Uint256& a, const Uint256& b, Uint256& high) {
    // Schoolbook 256x256 -> 512, accumulating 64-bit halves per column
    __uint128_t columns[8] = {0};

    for (size_t i = 0; i < NUM_LIMBS; ++i) {
        for (size_t j = 0; j < NUM_LIMBS; ++j) {
            __uint128_t prod = static_cast<__uint128_t>(a.limbs[i]) *
                               static_cast<__uint128_t>(b.limbs[j]);
            columns[i + j] += static_cast<uint64_t>(prod);
            columns[i + j + 1] += prod >> 64;
        }
    }

    uint64_t out[8];
    __uint128_t carry = 0;
    for (size_t i = 0; i < 8; ++i) {
        __uint128_t sum = columns[i] + carry;
        out[i] = static_cast<uint64_t>(sum);
        carry = sum >> 64;
    }

    high = Uint256(out[4], out[5], out[6], out[7]);
    return Uint256(out[0], out[1], out[2], out[3]);
}

Uint256 Uint256::operator<<(int shift) const {
    if (shift <= 0) return *this;
    if (shift >= 256) return Uint256();

    Uint256 result;
    int limbShift = shift / 64;
    int bitShift = shift % 64;

    for (int i = 3; i >= limbShift; --i) {
        result.limbs[i] = limbs[i - limbShift] << bitShift;
        if (bitShift != 0 && i > limbShift) {
            result.limbs[i] |= limbs[i - limbShift - 1] >> (64 - bitShift);
        }
    }

    return result;
}

Uint256 Uint256::operator>>(int shift) const {
    if (shift <= 0) return *this;
    if (shift >= 256) return Uint256();

    Uint256 result;
    int limbShift = shift / 64;
    int bitShift = shift % 64;

    for (int i = 0; i < 4 - limbShift; ++i) {
        result.limbs[i] = limbs[i + limbShift] >> bitShift;
        if (bitShift != 0 && i + limbShift + 1 < 4) {
            result.limbs[i] |= limbs[i + limbShift + 1] << (64 - bitShift);
        }
    }

    return result;
}

// ============================================================================
// PrimeField Implementation
// ============================================================================

const PrimeField& PrimeField::Get(const Uint256& modulus) {
    FieldRegistry& registry = Registry();
    std::lock_guard<std::mutex> lock(registry.mutex);

    auto it = registry.fields.find(modulus);
    if (it != registry.fields.end()) {
        return *it->second;
    }

    std::unique_ptr<PrimeField> field(
        new PrimeField(modulus, NameForModulus(modulus)));
    const PrimeField& ref = *field;
    registry.fields.emplace(modulus, std::move(field));

    LOG_DEBUG(util::LogCategory::FIELD) << "Registered " << ref.Name()
        << " field, " << ref.BitLength() << " bits, modulus 0x"
        << modulus.ToHex();
    return ref;
}

size_t PrimeField::RegisteredCount() {
    FieldRegistry& registry = Registry();
    std::lock_guard<std::mutex> lock(registry.mutex);
    return registry.fields.size();
}

const PrimeField& PrimeField::BN254Scalar() {
    static const PrimeField& field = Get(BN254_SCALAR_MODULUS);
    return field;
}

const PrimeField& PrimeField::BLS12_381Scalar() {
    static const PrimeField& field = Get(BLS12_381_SCALAR_MODULUS);
    return field;
}

const PrimeField& PrimeField::FromName(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "bn254" || lower == "bn256" || lower == "alt_bn128") {
        return BN254Scalar();
    }
    if (lower == "bls12_381" || lower == "bls12-381") {
        return BLS12_381Scalar();
    }
    throw ConfigError(ConfigError::Kind::InvalidParameter,
                      "unknown curve '" + name + "'");
}

PrimeField::PrimeField(const Uint256& modulus, std::string name)
    : modulus_(modulus)
    , inv_(0)
    , bitLength_(modulus.BitLength())
    , byteWidth_((modulus.BitLength() + 7) / 8)
    , name_(std::move(name)) {
    if ((modulus.limbs[0] & 1) == 0 || modulus <= Uint256(3)) {
        throw ConfigError(ConfigError::Kind::InvalidParameter,
                          "modulus must be an odd prime greater than 3");
    }
    if (bitLength_ > MAX_MODULUS_BITS) {
        throw ConfigError(ConfigError::Kind::InvalidParameter,
                          "modulus must be below 2^255");
    }
    if (!IsProbablePrime(modulus)) {
        throw ConfigError(ConfigError::Kind::InvalidParameter,
                          "modulus is not prime");
    }

    // -p^(-1) mod 2^64 by Newton iteration; p0 is its own inverse mod 8
    uint64_t p0 = modulus.limbs[0];
    uint64_t x = p0;
    for (int i = 0; i < 6; ++i) {
        x *= 2 - p0 * x;
    }
    inv_ = ~x + 1;

    // R = 2^256 mod p and R^2 = 2^512 mod p by repeated modular doubling
    Uint256 acc(1);
    for (int i = 0; i < 256; ++i) {
        acc = ModAdd(acc, acc);
    }
    r_ = acc;
    for (int i = 0; i < 256; ++i) {
        acc = ModAdd(acc, acc);
    }
    r2_ = acc;

}

Uint256 PrimeField::ModAdd(const Uint256& a, const Uint256& b) const {
    bool carry;
    Uint256 sum = Uint256::Add(a, b, carry);

    if (carry || sum >= modulus_) {
        bool borrow;
        sum = Uint256::Sub(sum, modulus_, borrow);
    }
    return sum;
}

Uint256 PrimeField::ModSub(const Uint256& a, const Uint256& b) const {
    bool borrow;
    Uint256 diff = Uint256::Sub(a, b, borrow);

    if (borrow) {
        bool carry;
        diff = Uint256::Add(diff, modulus_, carry);
    }
    return diff;
}

Uint256 PrimeField::MontMul(const Uint256& a, const Uint256& b) const {
    Uint256 hi;
    Uint256 lo = Uint256::Mul(a, b, hi);
    return MontReduce(lo, hi);
}

Uint256 PrimeField::MontReduce(const Uint256& lo, const Uint256& hi) const {
    // Word-by-word REDC over the 512-bit value (hi:lo). The intermediate
    // stays below 2p < 2^256 because p has at most 255 bits.
    Uint256 result = lo;
    Uint256 high = hi;

    for (size_t i = 0; i < Uint256::NUM_LIMBS; ++i) {
        uint64_t m = result.limbs[0] * inv_;

        __uint128_t carry = 0;
        for (size_t j = 0; j < Uint256::NUM_LIMBS; ++j) {
            __uint128_t prod = static_cast<__uint128_t>(m) * modulus_.limbs[j];
            __uint128_t sum = static_cast<__uint128_t>(result.limbs[j]) + prod + carry;
            result.limbs[j] = static_cast<uint64_t>(sum);
            carry = sum >> 64;
        }

        for (size_t j = 0; j < Uint256::NUM_LIMBS && carry; ++j) {
            __uint128_t sum = static_cast<__uint128_t>(high.limbs[j]) + carry;
            high.limbs[j] = static_cast<uint64_t>(sum);
            carry = sum >> 64;
        }

        // result.limbs[0] is now zero; shift the 512-bit window down a limb
        result.limbs[0] = result.limbs[1];
        result.limbs[1] = result.limbs[2];
        result.limbs[2] = result.limbs[3];
        result.limbs[3] = high.limbs[0];

        high.limbs[0] = high.limbs[1];
        high.limbs[1] = high.limbs[2];
        high.limbs[2] = high.limbs[3];
        high.limbs[3] = 0;
    }

    if (result >= modulus_) {
        bool borrow;
        result = Uint256::Sub(result, modulus_, borrow);
    }
    return result;
}

Uint256 PrimeField::MontPow(const Uint256& base, const Uint256& exp) const {
    Uint256 result = r_;
    for (size_t i = exp.BitLength(); i-- > 0;) {
        result = MontMul(result, result);
        if (exp.TestBit(i)) {
            result = MontMul(result, base);
        }
    }
    return result;
}

Uint256 PrimeField::ToMont(const Uint256& val) const {
    // REDC(val * R^2) = val * R mod p for any 256-bit val
    return MontMul(val, r2_);
}

Uint256 PrimeField::FromMont(const Uint256& val) const {
    return MontMul(val, Uint256(1));
}

FieldElement PrimeField::Zero() const {
    return FieldElement(this, Uint256());
}

FieldElement PrimeField::One() const {
    return FieldElement(this, r_);
}

FieldElement PrimeField::FromUint64(uint64_t val) const {
    return FromUint256(Uint256(val));
}

FieldElement PrimeField::FromUint256(const Uint256& val) const {
    if (val >= modulus_) {
        throw FieldError(FieldError::Kind::NonCanonical,
                         "value 0x" + val.ToHex() + " is not below the modulus");
    }
    return FieldElement(this, ToMont(val));
}

FieldElement PrimeField::Reduce(const Uint256& val) const {
    return FieldElement(this, ToMont(val));
}

FieldElement PrimeField::FromBytes(const Byte* data, size_t len) const {
    if (len != byteWidth_) {
        throw FieldError(FieldError::Kind::BadEncoding,
                         "expected " + std::to_string(byteWidth_) +
                         " bytes, got " + std::to_string(len));
    }
    return FromUint256(Uint256(data, len));
}

FieldElement PrimeField::FromBytes(const ByteVector& data) const {
    return FromBytes(data.data(), data.size());
}

FieldElement PrimeField::FromBytesReduce(const Byte* data, size_t len) const {
    // Horner over 32-byte chunks, most significant chunk first
    FieldElement acc = Zero();
    FieldElement shift = Reduce(Uint256(1) << 128).Square();  // 2^256 mod p
    size_t chunks = (len + 31) / 32;
    for (size_t c = chunks; c-- > 0;) {
        size_t offset = c * 32;
        size_t n = std::min(size_t(32), len - offset);
        acc = acc * shift + Reduce(Uint256(data + offset, n));
    }
    return acc;
}

FieldElement PrimeField::FromHex(const std::string& hex) const {
    return FromUint256(Uint256::FromHex(hex));
}

FieldElement PrimeField::Random() const {
    std::array<Byte, 32> buf;
    const unsigned topBits = static_cast<unsigned>(bitLength_ % 8);

    for (;;) {
        buf.fill(0);
        if (RAND_bytes(buf.data(), static_cast<int>(byteWidth_)) != 1) {
            throw Error("field: RAND_bytes failed");
        }
        if (topBits != 0) {
            buf[byteWidth_ - 1] &= static_cast<Byte>((1u << topBits) - 1);
        }
        Uint256 candidate(buf.data(), byteWidth_);
        if (candidate < modulus_) {
            return FieldElement(this, ToMont(candidate));
        }
    }
}

// ============================================================================
// FieldElement Implementation
// ============================================================================

void FieldElement::RequireSameField(const FieldElement& other) const {
    if (field_ != other.field_) {
        throw ConfigError(ConfigError::Kind::ParameterMismatch,
                          "operands belong to different fields (" +
                          field_->Name() + ", " + other.field_->Name() + ")");
    }
}

Uint256 FieldElement::ToUint256() const {
    return field_->FromMont(value_);
}

uint64_t FieldElement::ToUint64() const {
    Uint256 v = ToUint256();
    if (v.BitLength() > 64) {
        throw FieldError(FieldError::Kind::Overflow, "value does not fit in 64 bits");
    }
    return v.limbs[0];
}

ByteVector FieldElement::ToBytes() const {
    auto full = ToUint256().ToBytes();
    return ByteVector(full.begin(), full.begin() + field_->ByteWidth());
}

std::string FieldElement::ToHex() const {
    ByteVector bytes = ToBytes();
    std::reverse(bytes.begin(), bytes.end());
    return BytesToHex(bytes);
}

std::vector<Byte> FieldElement::ToBits(size_t width) const {
    Uint256 v = ToUint256();
    if (v.BitLength() > width) {
        throw FieldError(FieldError::Kind::Overflow,
                         "value needs " + std::to_string(v.BitLength()) +
                         " bits, only " + std::to_string(width) + " allowed");
    }
    std::vector<Byte> bits(width, 0);
    for (size_t i = 0; i < width && i < 256; ++i) {
        bits[i] = v.TestBit(i) ? 1 : 0;
    }
    return bits;
}

size_t FieldElement::BitLength() const {
    return ToUint256().BitLength();
}

bool FieldElement::IsZero() const {
    return value_.IsZero();
}

bool FieldElement::IsOne() const {
    return value_ == field_->r_;
}

bool FieldElement::operator==(const FieldElement& other) const {
    return field_ == other.field_ && value_ == other.value_;
}

bool FieldElement::operator!=(const FieldElement& other) const {
    return !(*this == other);
}

FieldElement FieldElement::operator+(const FieldElement& other) const {
    RequireSameField(other);
    return FieldElement(field_, field_->ModAdd(value_, other.value_));
}

FieldElement FieldElement::operator-(const FieldElement& other) const {
    RequireSameField(other);
    return FieldElement(field_, field_->ModSub(value_, other.value_));
}

FieldElement FieldElement::operator*(const FieldElement& other) const {
    RequireSameField(other);
    return FieldElement(field_, field_->MontMul(value_, other.value_));
}

FieldElement FieldElement::operator-() const {
    if (IsZero()) return *this;
    bool borrow;
    return FieldElement(field_, Uint256::Sub(field_->modulus_, value_, borrow));
}

FieldElement FieldElement::Square() const {
    return FieldElement(field_, field_->MontMul(value_, value_));
}

FieldElement FieldElement::Pow(const Uint256& exp) const {
    return FieldElement(field_, field_->MontPow(value_, exp));
}

FieldElement FieldElement::Pow(uint64_t exp) const {
    return Pow(Uint256(exp));
}

FieldElement FieldElement::Inverse() const {
    if (IsZero()) {
        throw FieldError(FieldError::Kind::NotInvertible, "inverse of zero");
    }
    // Fermat: a^(p-2)
    bool borrow;
    Uint256 pMinus2 = Uint256::Sub(field_->modulus_, Uint256(2), borrow);
    return Pow(pMinus2);
}

FieldElement FieldElement::PoseidonSbox() const {
    FieldElement x2 = Square();
    FieldElement x4 = x2.Square();
    return x4 * (*this);
}

// ============================================================================
// Limb Helpers
// ============================================================================

std::pair<FieldElement, FieldElement> SplitToLimbs(const PrimeField& field,
                                                   const Uint256& value) {
    if (field.BitLength() <= 128) {
        throw ConfigError(ConfigError::Kind::InvalidParameter,
                          "limb split needs a field wider than 128 bits");
    }
    Uint256 low(value.limbs[0], value.limbs[1], 0, 0);
    Uint256 high(value.limbs[2], value.limbs[3], 0, 0);
    return {field.FromUint256(low), field.FromUint256(high)};
}

Uint256 JoinLimbs(const FieldElement& low, const FieldElement& high) {
    Uint256 lo = low.ToUint256();
    Uint256 hi = high.ToUint256();
    if (lo.BitLength() > 128 || hi.BitLength() > 128) {
        throw FieldError(FieldError::Kind::Overflow, "limb wider than 128 bits");
    }
    return Uint256(lo.limbs[0], lo.limbs[1], hi.limbs[0], hi.limbs[1]);
}

} // namespace zkanchor
