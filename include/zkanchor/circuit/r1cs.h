// ZKANCHOR - Rank-1 Constraint System
// Copyright (c) 2024 ZKANCHOR Developers
// MIT License
//
// Constraints of the form <A, z> * <B, z> = <C, z> over an assignment z.
// Variable 0 is the constant one; public inputs follow it, then the
// private witness, then auxiliary variables introduced by gadgets.

#ifndef ZKANCHOR_CIRCUIT_R1CS_H
#define ZKANCHOR_CIRCUIT_R1CS_H

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "zkanchor/crypto/field.h"
#include "zkanchor/crypto/sha256.h"

namespace zkanchor {
namespace circuit {

/// Role of a variable in the assignment layout
enum class VariableKind {
    One,
    Public,
    Witness,
    Aux
};

/// Index into the assignment vector
struct Variable {
    size_t index{0};

    static Variable One() { return Variable{0}; }

    bool operator==(const Variable& other) const { return index == other.index; }
    bool operator<(const Variable& other) const { return index < other.index; }
};

// ============================================================================
// Linear Combination
// ============================================================================

/// Sparse sum of coefficient * variable; constants sit on Variable::One()
class LinearCombination {
public:
    explicit LinearCombination(const PrimeField& field);
    LinearCombination(const PrimeField& field, Variable var);

    static LinearCombination Constant(const FieldElement& value);

    const PrimeField& Field() const { return *field_; }

    LinearCombination& AddTerm(Variable var, const FieldElement& coeff);
    LinearCombination& AddConstant(const FieldElement& value);

    LinearCombination operator+(const LinearCombination& other) const;
    LinearCombination operator-(const LinearCombination& other) const;
    LinearCombination operator*(const FieldElement& scalar) const;

    /// Non-zero terms keyed by variable index
    const std::map<size_t, FieldElement>& Terms() const { return terms_; }

    bool IsConstant() const;

    /// <this, assignment>; throws WitnessError::ShapeMismatch if a term
    /// refers past the end of the assignment
    FieldElement Evaluate(const std::vector<FieldElement>& assignment) const;

private:
    const PrimeField* field_;
    std::map<size_t, FieldElement> terms_;
};

// ============================================================================
// Constraint System
// ============================================================================

struct Constraint {
    LinearCombination a;
    LinearCombination b;
    LinearCombination c;
    std::string annotation;

    bool IsSatisfied(const std::vector<FieldElement>& assignment) const;
};

class ConstraintSystem {
public:
    explicit ConstraintSystem(const PrimeField& field);

    const PrimeField& Field() const { return *field_; }

    /// Variables must be allocated in layout order: public, witness, aux.
    /// Throws Error on an out-of-order allocation.
    Variable Allocate(VariableKind kind, const std::string& name);

    void Enforce(LinearCombination a, LinearCombination b, LinearCombination c,
                 const std::string& annotation);

    size_t NumVariables() const { return names_.size(); }
    size_t NumPublic() const { return numPublic_; }
    size_t NumWitness() const { return numWitness_; }
    size_t NumAux() const { return numAux_; }
    size_t NumConstraints() const { return constraints_.size(); }

    /// Index of the first private (witness or aux) variable
    size_t PrivateOffset() const { return 1 + numPublic_; }

    const std::vector<Constraint>& Constraints() const { return constraints_; }
    const std::string& VariableName(size_t index) const { return names_.at(index); }

    /**
     * Index of the first constraint the assignment violates.
     * Throws WitnessError::ShapeMismatch if the assignment does not have
     * NumVariables() entries or its first entry is not one.
     */
    std::optional<size_t> FirstUnsatisfied(const std::vector<FieldElement>& assignment) const;

    bool IsSatisfied(const std::vector<FieldElement>& assignment) const {
        return !FirstUnsatisfied(assignment).has_value();
    }

    /// SHA-256 over the variable layout and every coefficient; two systems
    /// with equal digests accept the same assignments
    Sha256Digest ShapeDigest() const;

private:
    const PrimeField* field_;
    std::vector<std::string> names_;
    size_t numPublic_{0};
    size_t numWitness_{0};
    size_t numAux_{0};
    std::vector<Constraint> constraints_;
};

// ============================================================================
// Circuit Builder
// ============================================================================

/**
 * Drives circuit synthesis. In shape mode only the constraint system is
 * produced; in value mode every allocation carries a value and the builder
 * also produces the full assignment.
 */
class CircuitBuilder {
public:
    CircuitBuilder(const PrimeField& field, bool withValues);

    const PrimeField& Field() const { return system_.Field(); }
    bool HasValues() const { return withValues_; }

    /// Throws Error in value mode when `value` is missing
    Variable Allocate(VariableKind kind, const std::string& name,
                      const std::optional<FieldElement>& value);

    void Enforce(LinearCombination a, LinearCombination b, LinearCombination c,
                 const std::string& annotation) {
        system_.Enforce(std::move(a), std::move(b), std::move(c), annotation);
    }

    LinearCombination Lc(Variable var) const { return LinearCombination(Field(), var); }
    LinearCombination Constant(const FieldElement& value) const {
        return LinearCombination::Constant(value);
    }

    /// Value of a combination in value mode, nullopt in shape mode
    std::optional<FieldElement> Evaluate(const LinearCombination& lc) const;

    const ConstraintSystem& System() const { return system_; }
    const std::vector<FieldElement>& Assignment() const { return assignment_; }

    ConstraintSystem TakeSystem() { return std::move(system_); }
    std::vector<FieldElement> TakeAssignment() { return std::move(assignment_); }

private:
    ConstraintSystem system_;
    bool withValues_;
    std::vector<FieldElement> assignment_;
};

} // namespace circuit
} // namespace zkanchor

#endif // ZKANCHOR_CIRCUIT_R1CS_H
