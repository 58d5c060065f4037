// ZKANCHOR - Rank-1 Constraint System Implementation
// Copyright (c) 2024 ZKANCHOR Developers
// MIT License

#include "zkanchor/circuit/r1cs.h"

#include "zkanchor/core/errors.h"

namespace zkanchor {
namespace circuit {

// ============================================================================
// LinearCombination
// ============================================================================

LinearCombination::LinearCombination(const PrimeField& field)
    : field_(&field) {}

LinearCombination::LinearCombination(const PrimeField& field, Variable var)
    : field_(&field) {
    terms_.emplace(var.index, field.One());
}

LinearCombination LinearCombination::Constant(const FieldElement& value) {
    LinearCombination lc(value.Field());
    lc.AddConstant(value);
    return lc;
}

LinearCombination& LinearCombination::AddTerm(Variable var, const FieldElement& coeff) {
    if (coeff.Field() != *field_) {
        throw ConfigError(ConfigError::Kind::ParameterMismatch,
                          "coefficient belongs to a different field");
    }
    auto it = terms_.find(var.index);
    if (it == terms_.end()) {
        if (!coeff.IsZero()) {
            terms_.emplace(var.index, coeff);
        }
        return *this;
    }
    it->second = it->second + coeff;
    if (it->second.IsZero()) {
        terms_.erase(it);
    }
    return *this;
}

LinearCombination& LinearCombination::AddConstant(const FieldElement& value) {
    return AddTerm(Variable::One(), value);
}

LinearCombination LinearCombination::operator+(const LinearCombination& other) const {
    LinearCombination result(*this);
    for (const auto& term : other.terms_) {
        result.AddTerm(Variable{term.first}, term.second);
    }
    return result;
}

LinearCombination LinearCombination::operator-(const LinearCombination& other) const {
    LinearCombination result(*this);
    for (const auto& term : other.terms_) {
        result.AddTerm(Variable{term.first}, -term.second);
    }
    return result;
}

LinearCombination LinearCombination::operator*(const FieldElement& scalar) const {
    LinearCombination result(*field_);
    if (scalar.IsZero()) {
        return result;
    }
    for (const auto& term : terms_) {
        result.terms_.emplace(term.first, term.second * scalar);
    }
    return result;
}

bool LinearCombination::IsConstant() const {
    return terms_.empty() || (terms_.size() == 1 && terms_.begin()->first == 0);
}

FieldElement LinearCombination::Evaluate(const std::vector<FieldElement>& assignment) const {
    FieldElement acc = field_->Zero();
    for (const auto& term : terms_) {
        if (term.first >= assignment.size()) {
            throw WitnessError(WitnessError::Kind::ShapeMismatch,
                               "variable " + std::to_string(term.first) +
                               " is not assigned");
        }
        acc = acc + term.second * assignment[term.first];
    }
    return acc;
}

bool Constraint::IsSatisfied(const std::vector<FieldElement>& assignment) const {
    return a.Evaluate(assignment) * b.Evaluate(assignment) == c.Evaluate(assignment);
}

// ============================================================================
// ConstraintSystem
// ============================================================================

ConstraintSystem::ConstraintSystem(const PrimeField& field)
    : field_(&field) {
    names_.push_back("one");
}

Variable ConstraintSystem::Allocate(VariableKind kind, const std::string& name) {
    switch (kind) {
        case VariableKind::One:
            throw Error("circuit: the constant one is allocated implicitly");
        case VariableKind::Public:
            if (numWitness_ != 0 || numAux_ != 0) {
                throw Error("circuit: public variable '" + name +
                            "' allocated after private variables");
            }
            ++numPublic_;
            break;
        case VariableKind::Witness:
            if (numAux_ != 0) {
                throw Error("circuit: witness variable '" + name +
                            "' allocated after auxiliary variables");
            }
            ++numWitness_;
            break;
        case VariableKind::Aux:
            ++numAux_;
            break;
    }
    names_.push_back(name);
    return Variable{names_.size() - 1};
}

void ConstraintSystem::Enforce(LinearCombination a, LinearCombination b,
                               LinearCombination c, const std::string& annotation) {
    if (a.Field() != *field_ || b.Field() != *field_ || c.Field() != *field_) {
        throw ConfigError(ConfigError::Kind::ParameterMismatch,
                          "constraint '" + annotation + "' mixes fields");
    }
    constraints_.push_back(Constraint{std::move(a), std::move(b), std::move(c), annotation});
}

std::optional<size_t> ConstraintSystem::FirstUnsatisfied(
        const std::vector<FieldElement>& assignment) const {
    if (assignment.size() != NumVariables()) {
        throw WitnessError(WitnessError::Kind::ShapeMismatch,
                           "assignment has " + std::to_string(assignment.size()) +
                           " values, system has " + std::to_string(NumVariables()) +
                           " variables");
    }
    if (assignment.front().Field() != *field_ || !assignment.front().IsOne()) {
        throw WitnessError(WitnessError::Kind::ShapeMismatch,
                           "assignment does not start with the constant one");
    }

    for (size_t i = 0; i < constraints_.size(); ++i) {
        if (!constraints_[i].IsSatisfied(assignment)) {
            return i;
        }
    }
    return std::nullopt;
}

Sha256Digest ConstraintSystem::ShapeDigest() const {
    SHA256 hasher;
    ByteVector header;
    WriteLE64(header, numPublic_);
    WriteLE64(header, numWitness_);
    WriteLE64(header, numAux_);
    WriteLE64(header, constraints_.size());
    auto modulus = field_->Modulus().ToBytes();
    hasher.Write(modulus.data(), modulus.size()).Write(header);

    auto writeLc = [&hasher](const LinearCombination& lc) {
        ByteVector buf;
        WriteLE64(buf, lc.Terms().size());
        for (const auto& term : lc.Terms()) {
            WriteLE64(buf, term.first);
            ByteVector coeff = term.second.ToBytes();
            buf.insert(buf.end(), coeff.begin(), coeff.end());
        }
        hasher.Write(buf);
    };

    for (const auto& constraint : constraints_) {
        writeLc(constraint.a);
        writeLc(constraint.b);
        writeLc(constraint.c);
    }

    Sha256Digest digest;
    hasher.Finalize(digest.data());
    return digest;
}

// ============================================================================
// CircuitBuilder
// ============================================================================

CircuitBuilder::CircuitBuilder(const PrimeField& field, bool withValues)
    : system_(field), withValues_(withValues) {
    if (withValues_) {
        assignment_.push_back(field.One());
    }
}

Variable CircuitBuilder::Allocate(VariableKind kind, const std::string& name,
                                  const std::optional<FieldElement>& value) {
    if (withValues_ && !value) {
        throw Error("circuit: no value for '" + name + "'");
    }
    Variable var = system_.Allocate(kind, name);
    if (withValues_) {
        if (value->Field() != Field()) {
            throw ConfigError(ConfigError::Kind::ParameterMismatch,
                              "value for '" + name + "' belongs to a different field");
        }
        assignment_.push_back(*value);
    }
    return var;
}

std::optional<FieldElement> CircuitBuilder::Evaluate(const LinearCombination& lc) const {
    if (!withValues_) {
        return std::nullopt;
    }
    return lc.Evaluate(assignment_);
}

} // namespace circuit
} // namespace zkanchor
