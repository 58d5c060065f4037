// ZKANCHOR - Error Types
// Copyright (c) 2024 ZKANCHOR Developers
// MIT License
//
// Typed exceptions raised by the field, Merkle, anchor, range, witness,
// configuration and proof-format layers. Every error carries a kind so
// callers can branch without parsing messages.

#ifndef ZKANCHOR_CORE_ERRORS_H
#define ZKANCHOR_CORE_ERRORS_H

#include <stdexcept>
#include <string>

namespace zkanchor {

/// Base class for all ZKANCHOR errors
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

// ============================================================================
// Field Errors
// ============================================================================

class FieldError : public Error {
public:
    enum class Kind {
        Overflow,       ///< Value needs more bits than requested
        NotInvertible,  ///< Inverse of zero
        NonCanonical,   ///< Encoded value >= p
        BadEncoding     ///< Wrong byte length or malformed hex
    };

    FieldError(Kind kind, const std::string& message)
        : Error("field: " + message), kind_(kind) {}

    Kind GetKind() const { return kind_; }

private:
    Kind kind_;
};

// ============================================================================
// Merkle Errors
// ============================================================================

class MerkleError : public Error {
public:
    enum class Kind {
        TooManyLeaves,
        IndexOutOfRange,
        PathLengthMismatch,
        InvalidDepth,
        BadEncoding
    };

    MerkleError(Kind kind, const std::string& message)
        : Error("merkle: " + message), kind_(kind) {}

    Kind GetKind() const { return kind_; }

private:
    Kind kind_;
};

// ============================================================================
// Anchor / Range / Witness Errors
// ============================================================================

/// Recomputed anchor disagrees with the claimed public anchor
class AnchorMismatch : public Error {
public:
    explicit AnchorMismatch(const std::string& message)
        : Error("anchor: " + message) {}
};

class RangeError : public Error {
public:
    enum class Kind {
        OutOfRange,    ///< Value outside [lo, hi] under the configured width
        InvalidQuery   ///< lo > hi or hi does not fit in the width
    };

    RangeError(Kind kind, const std::string& message)
        : Error("range: " + message), kind_(kind) {}

    Kind GetKind() const { return kind_; }

private:
    Kind kind_;
};

class WitnessError : public Error {
public:
    enum class Kind {
        ShapeMismatch,
        Unsatisfied    ///< Native pre-flight check rejected the witness
    };

    WitnessError(Kind kind, const std::string& message)
        : Error("witness: " + message), kind_(kind) {}

    Kind GetKind() const { return kind_; }

private:
    Kind kind_;
};

// ============================================================================
// Configuration / Format Errors
// ============================================================================

class ConfigError : public Error {
public:
    enum class Kind {
        ParameterMismatch,
        InvalidParameter,
        ParseError
    };

    ConfigError(Kind kind, const std::string& message)
        : Error("config: " + message), kind_(kind) {}

    Kind GetKind() const { return kind_; }

private:
    Kind kind_;
};

/// Malformed serialized proof
class ProofFormatError : public Error {
public:
    explicit ProofFormatError(const std::string& message)
        : Error("proof: " + message) {}
};

} // namespace zkanchor

#endif // ZKANCHOR_CORE_ERRORS_H
