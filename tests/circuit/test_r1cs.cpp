// ZKANCHOR - Constraint System Tests
// Copyright (c) 2024 ZKANCHOR Developers
// MIT License

#include <gtest/gtest.h>
#include "zkanchor/circuit/r1cs.h"
#include "zkanchor/core/errors.h"

namespace zkanchor {
namespace circuit {
namespace test {

class R1CSTest : public ::testing::Test {
protected:
    FieldElement E(uint64_t v) const { return f.FromUint64(v); }

    const PrimeField& f = PrimeField::BN254Scalar();
};

// ============================================================================
// Linear Combinations
// ============================================================================

TEST_F(R1CSTest, Evaluate) {
    // 3 + 2*x1 - x2 at z = [1, 5, 4]
    LinearCombination lc(f);
    lc.AddConstant(E(3)).AddTerm(Variable{1}, E(2)).AddTerm(Variable{2}, f.Zero() - f.One());
    EXPECT_EQ(lc.Evaluate({f.One(), E(5), E(4)}), E(9));
    EXPECT_FALSE(lc.IsConstant());
}

TEST_F(R1CSTest, TermsMergeAndCancel) {
    LinearCombination lc(f, Variable{1});
    lc.AddTerm(Variable{1}, E(4));
    ASSERT_EQ(lc.Terms().size(), 1u);
    EXPECT_EQ(lc.Terms().at(1), E(5));

    LinearCombination diff = lc - LinearCombination(f, Variable{1}) * E(5);
    EXPECT_TRUE(diff.Terms().empty());
    EXPECT_TRUE(diff.IsConstant());
}

TEST_F(R1CSTest, Algebra) {
    LinearCombination x(f, Variable{1});
    LinearCombination y(f, Variable{2});
    LinearCombination sum = (x + y) * E(3) + LinearCombination::Constant(E(7));
    EXPECT_EQ(sum.Evaluate({f.One(), E(2), E(10)}), E(43));
    EXPECT_TRUE(LinearCombination::Constant(E(7)).IsConstant());
}

TEST_F(R1CSTest, EvaluateOutOfRange) {
    LinearCombination lc(f, Variable{3});
    try {
        lc.Evaluate({f.One(), E(1)});
        FAIL() << "expected WitnessError";
    } catch (const WitnessError& e) {
        EXPECT_EQ(e.GetKind(), WitnessError::Kind::ShapeMismatch);
    }
}

TEST_F(R1CSTest, ForeignCoefficient) {
    LinearCombination lc(f);
    EXPECT_THROW(lc.AddTerm(Variable{1}, PrimeField::BLS12_381Scalar().One()), ConfigError);
}

// ============================================================================
// Constraint System
// ============================================================================

TEST_F(R1CSTest, LayoutOrder) {
    ConstraintSystem cs(f);
    EXPECT_EQ(cs.NumVariables(), 1u);
    EXPECT_EQ(cs.VariableName(0), "one");

    Variable p = cs.Allocate(VariableKind::Public, "p");
    Variable w = cs.Allocate(VariableKind::Witness, "w");
    Variable a = cs.Allocate(VariableKind::Aux, "a");
    EXPECT_EQ(p.index, 1u);
    EXPECT_EQ(w.index, 2u);
    EXPECT_EQ(a.index, 3u);
    EXPECT_EQ(cs.NumPublic(), 1u);
    EXPECT_EQ(cs.NumWitness(), 1u);
    EXPECT_EQ(cs.NumAux(), 1u);
    EXPECT_EQ(cs.PrivateOffset(), 2u);
    EXPECT_EQ(cs.VariableName(2), "w");

    EXPECT_THROW(cs.Allocate(VariableKind::Public, "late"), Error);
    EXPECT_THROW(cs.Allocate(VariableKind::Witness, "late"), Error);
    EXPECT_THROW(cs.Allocate(VariableKind::One, "one"), Error);
}

TEST_F(R1CSTest, Satisfaction) {
    // x * x = y
    ConstraintSystem cs(f);
    Variable y = cs.Allocate(VariableKind::Public, "y");
    Variable x = cs.Allocate(VariableKind::Witness, "x");
    cs.Enforce(LinearCombination(f, x), LinearCombination(f, x), LinearCombination(f, y),
               "square");
    ASSERT_EQ(cs.NumConstraints(), 1u);
    EXPECT_EQ(cs.Constraints()[0].annotation, "square");

    EXPECT_TRUE(cs.IsSatisfied({f.One(), E(9), E(3)}));
    EXPECT_TRUE(cs.IsSatisfied({f.One(), E(9), f.Zero() - E(3)}));

    std::optional<size_t> failing = cs.FirstUnsatisfied({f.One(), E(10), E(3)});
    ASSERT_TRUE(failing.has_value());
    EXPECT_EQ(*failing, 0u);
}

TEST_F(R1CSTest, MalformedAssignment) {
    ConstraintSystem cs(f);
    cs.Allocate(VariableKind::Public, "y");
    EXPECT_THROW(cs.FirstUnsatisfied({f.One()}), WitnessError);
    EXPECT_THROW(cs.FirstUnsatisfied({E(2), E(3)}), WitnessError);
}

TEST_F(R1CSTest, ShapeDigest) {
    auto build = [this](uint64_t coeff) {
        ConstraintSystem cs(f);
        Variable x = cs.Allocate(VariableKind::Witness, "x");
        cs.Enforce(LinearCombination(f, x), LinearCombination::Constant(E(coeff)),
                   LinearCombination(f, x), "scale");
        return cs;
    };
    EXPECT_EQ(build(1).ShapeDigest(), build(1).ShapeDigest());
    EXPECT_NE(build(1).ShapeDigest(), build(2).ShapeDigest());

    // Names are not part of the shape
    ConstraintSystem renamed(f);
    Variable x = renamed.Allocate(VariableKind::Witness, "renamed");
    renamed.Enforce(LinearCombination(f, x), LinearCombination::Constant(E(1)),
                    LinearCombination(f, x), "other annotation");
    EXPECT_EQ(renamed.ShapeDigest(), build(1).ShapeDigest());
}

// ============================================================================
// Circuit Builder
// ============================================================================

TEST_F(R1CSTest, BuilderValueMode) {
    CircuitBuilder builder(f, true);
    Variable x = builder.Allocate(VariableKind::Witness, "x", E(6));
    ASSERT_EQ(builder.Assignment().size(), 2u);
    EXPECT_EQ(builder.Assignment()[0], f.One());
    EXPECT_EQ(builder.Evaluate(builder.Lc(x) + builder.Constant(E(1))), E(7));

    EXPECT_THROW(builder.Allocate(VariableKind::Aux, "missing", std::nullopt), Error);
    EXPECT_THROW(builder.Allocate(VariableKind::Aux, "foreign",
                                  PrimeField::BLS12_381Scalar().One()),
                 ConfigError);
}

TEST_F(R1CSTest, BuilderShapeMode) {
    CircuitBuilder builder(f, false);
    Variable x = builder.Allocate(VariableKind::Witness, "x", std::nullopt);
    EXPECT_FALSE(builder.Evaluate(builder.Lc(x)).has_value());
    EXPECT_TRUE(builder.Assignment().empty());
    EXPECT_EQ(builder.System().NumWitness(), 1u);
}

} // namespace test
} // namespace circuit
} // namespace zkanchor
