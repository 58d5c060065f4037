// ZKANCHOR - Native Verifier Tests
// Copyright (c) 2024 ZKANCHOR Developers
// MIT License

#include <gtest/gtest.h>

#include <memory>

#include "zkanchor/protocol/verifier.h"
#include "zkanchor/core/errors.h"

namespace zkanchor {
namespace protocol {
namespace test {

class NativeVerifierTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::vector<FieldElement> leaves;
        for (uint64_t i = 0; i < 10; ++i) {
            leaves.push_back(f.FromUint64(i));
        }
        tree_.reset(new MerkleTree(MerkleTree::Build(f, leaves, 4)));
    }

    PublicInputs PublicFor(uint64_t lo, uint64_t hi) const {
        FieldElement loElem = f.FromUint64(lo);
        FieldElement hiElem = f.FromUint64(hi);
        return PublicInputs{DeriveAnchor(tree_->Root(), loElem, hiElem, params.DomainTag()),
                            loElem, hiElem};
    }

    Witness WitnessFor(uint64_t index, uint64_t lo, uint64_t hi) const {
        RangeWitness range = RangeEncoder(params).Encode(tree_->Leaf(index), f.FromUint64(lo),
                                                         f.FromUint64(hi));
        return WitnessAssembler(params).Assemble(tree_->Leaf(index), tree_->PathFor(index),
                                                 range);
    }

    /// Copy of `w` with one raw value replaced
    static Witness Tampered(const Witness& w, size_t position, const FieldElement& value) {
        std::vector<FieldElement> values = w.Values();
        values[position] = value;
        return Witness::FromValues(w.Depth(), w.RangeBits(), values);
    }

    CheckFailure FailureOf(const Witness& w) const {
        CheckResult result = verifier.Check(publicInputs, w);
        EXPECT_FALSE(result);
        return result.failure;
    }

    const PrimeField& f = PrimeField::BN254Scalar();
    ProtocolParams params{f, 4, 8};
    NativeVerifier verifier{params};
    std::unique_ptr<MerkleTree> tree_;
    PublicInputs publicInputs{f.Zero(), f.Zero(), f.Zero()};
    Witness witness = Witness::FromValues(4, 8, std::vector<FieldElement>(25, f.Zero()));

    // Offsets into the raw layout for D = 4
    static constexpr size_t SIBLINGS = 1;
    static constexpr size_t DIRECTIONS = 5;
    static constexpr size_t LOW = 9;
    static constexpr size_t HIGH = 17;
};

class NativeVerifierQueryTest : public NativeVerifierTest {
protected:
    void SetUp() override {
        NativeVerifierTest::SetUp();
        publicInputs = PublicFor(2, 8);
        witness = WitnessFor(5, 2, 8);
    }
};

// ============================================================================
// Accepting
// ============================================================================

TEST_F(NativeVerifierQueryTest, ValidWitness) {
    CheckResult result = verifier.Check(publicInputs, witness);
    EXPECT_TRUE(result);
    EXPECT_EQ(result.failure, CheckFailure::None);
    EXPECT_TRUE(result.detail.empty());
}

TEST_F(NativeVerifierTest, BoundaryValues) {
    EXPECT_TRUE(verifier.Check(PublicFor(5, 5), WitnessFor(5, 5, 5)));
    EXPECT_TRUE(verifier.Check(PublicFor(0, 255), WitnessFor(0, 0, 255)));
    EXPECT_TRUE(verifier.Check(PublicFor(0, 9), WitnessFor(9, 0, 9)));
}

// ============================================================================
// Tampered Witnesses
// ============================================================================

TEST_F(NativeVerifierQueryTest, TamperedLeaf) {
    EXPECT_EQ(FailureOf(Tampered(witness, 0, f.FromUint64(6))), CheckFailure::AnchorMismatch);
}

TEST_F(NativeVerifierQueryTest, TamperedSibling) {
    FieldElement sibling = witness.Sibling(2) + f.One();
    EXPECT_EQ(FailureOf(Tampered(witness, SIBLINGS + 2, sibling)),
              CheckFailure::AnchorMismatch);
}

TEST_F(NativeVerifierQueryTest, SingleBitFlips) {
    auto flip = [](const FieldElement& x, size_t bit) {
        ByteVector bytes = x.ToBytes();
        bytes[bit / 8] ^= static_cast<Byte>(1u << (bit % 8));
        return x.Field().FromBytesReduce(bytes.data(), bytes.size());
    };

    for (size_t bit : {size_t(0), size_t(9), size_t(128), size_t(251)}) {
        EXPECT_EQ(FailureOf(Tampered(witness, 0, flip(witness.Leaf(), bit))),
                  CheckFailure::AnchorMismatch) << "leaf bit " << bit;
        for (size_t level = 0; level < 4; ++level) {
            EXPECT_EQ(FailureOf(Tampered(witness, SIBLINGS + level,
                                         flip(witness.Sibling(level), bit))),
                      CheckFailure::AnchorMismatch) << "sibling " << level << " bit " << bit;
        }

        PublicInputs badAnchor = publicInputs;
        badAnchor.anchor = flip(publicInputs.anchor, bit);
        CheckResult result = verifier.Check(badAnchor, witness);
        EXPECT_FALSE(result);
        EXPECT_EQ(result.failure, CheckFailure::AnchorMismatch) << "anchor bit " << bit;
    }
}

TEST_F(NativeVerifierQueryTest, NonBooleanDirection) {
    CheckResult result = verifier.Check(publicInputs,
                                        Tampered(witness, DIRECTIONS + 1, f.FromUint64(2)));
    EXPECT_FALSE(result);
    EXPECT_EQ(result.failure, CheckFailure::NonBooleanDirection);
    EXPECT_NE(result.detail.find("level 1"), std::string::npos);
}

TEST_F(NativeVerifierQueryTest, FlippedDirection) {
    FieldElement flipped = witness.Direction(0).IsOne() ? f.Zero() : f.One();
    EXPECT_EQ(FailureOf(Tampered(witness, DIRECTIONS, flipped)), CheckFailure::AnchorMismatch);
}

TEST_F(NativeVerifierQueryTest, NonBooleanBit) {
    EXPECT_EQ(FailureOf(Tampered(witness, LOW + 3, f.FromUint64(2))),
              CheckFailure::NonBooleanBit);
    EXPECT_EQ(FailureOf(Tampered(witness, HIGH + 7, f.Zero() - f.One())),
              CheckFailure::NonBooleanBit);
}

TEST_F(NativeVerifierQueryTest, FlippedGapBits) {
    FieldElement lowFlipped = witness.LowBit(4).IsOne() ? f.Zero() : f.One();
    EXPECT_EQ(FailureOf(Tampered(witness, LOW + 4, lowFlipped)), CheckFailure::LowGapMismatch);

    FieldElement highFlipped = witness.HighBit(0).IsOne() ? f.Zero() : f.One();
    EXPECT_EQ(FailureOf(Tampered(witness, HIGH, highFlipped)), CheckFailure::HighGapMismatch);
}

TEST_F(NativeVerifierTest, ValueBelowPublicRange) {
    // Anchor is honest for [6, 8] but the gaps were computed for [2, 8]
    publicInputs = PublicFor(6, 8);
    EXPECT_EQ(FailureOf(WitnessFor(5, 2, 8)), CheckFailure::LowGapMismatch);
}

TEST_F(NativeVerifierQueryTest, FailureNames) {
    EXPECT_STREQ(CheckFailureToString(CheckFailure::None), "none");
    EXPECT_STREQ(CheckFailureToString(CheckFailure::AnchorMismatch), "anchor mismatch");
    EXPECT_STREQ(CheckFailureToString(CheckFailure::HighGapMismatch), "high gap mismatch");
}

// ============================================================================
// Context Mismatches
// ============================================================================

TEST_F(NativeVerifierQueryTest, OtherDomainTag) {
    NativeVerifier other(ProtocolParams(f, 4, 8, "another.deployment"));
    CheckResult result = other.Check(publicInputs, witness);
    EXPECT_FALSE(result);
    EXPECT_EQ(result.failure, CheckFailure::AnchorMismatch);
}

TEST_F(NativeVerifierQueryTest, AnchoredToOtherTree) {
    std::vector<FieldElement> leaves;
    for (uint64_t i = 0; i < 10; ++i) {
        leaves.push_back(f.FromUint64(i == 3 ? 42 : i));
    }
    MerkleTree other = MerkleTree::Build(f, leaves, 4);
    ASSERT_NE(other.Root(), tree_->Root());

    // Same leaf value and range, anchor bound to the second root
    FieldElement lo = f.FromUint64(2);
    FieldElement hi = f.FromUint64(8);
    PublicInputs foreign{DeriveAnchor(other.Root(), lo, hi, params.DomainTag()), lo, hi};
    CheckResult result = verifier.Check(foreign, witness);
    EXPECT_FALSE(result);
    EXPECT_EQ(result.failure, CheckFailure::AnchorMismatch);

    // And a witness from the second tree against the first tree's anchor
    RangeWitness range = RangeEncoder(params).Encode(other.Leaf(5), lo, hi);
    Witness otherWitness = WitnessAssembler(params).Assemble(other.Leaf(5),
                                                             other.PathFor(5), range);
    EXPECT_TRUE(verifier.Check(foreign, otherWitness));
    EXPECT_EQ(FailureOf(otherWitness), CheckFailure::AnchorMismatch);
}

TEST_F(NativeVerifierQueryTest, OtherDepth) {
    NativeVerifier other(ProtocolParams(f, 5, 8));
    try {
        other.Check(publicInputs, witness);
        FAIL() << "expected WitnessError";
    } catch (const WitnessError& e) {
        EXPECT_EQ(e.GetKind(), WitnessError::Kind::ShapeMismatch);
    }
}

TEST_F(NativeVerifierQueryTest, OtherField) {
    NativeVerifier other(ProtocolParams(PrimeField::BLS12_381Scalar(), 4, 8));
    EXPECT_THROW(other.Check(publicInputs, witness), ConfigError);
}

TEST_F(NativeVerifierQueryTest, MalformedPublicRange) {
    PublicInputs swapped{publicInputs.anchor, f.FromUint64(8), f.FromUint64(2)};
    try {
        verifier.Check(swapped, witness);
        FAIL() << "expected RangeError";
    } catch (const RangeError& e) {
        EXPECT_EQ(e.GetKind(), RangeError::Kind::InvalidQuery);
    }

    PublicInputs wide{publicInputs.anchor, f.Zero(), f.FromUint64(256)};
    EXPECT_THROW(verifier.Check(wide, witness), RangeError);
}

} // namespace test
} // namespace protocol
} // namespace zkanchor
