// ZKANCHOR - Anchored Range Circuit Implementation
// Copyright (c) 2024 ZKANCHOR Developers
// MIT License

#include "zkanchor/circuit/anchored_range_circuit.h"

#include "zkanchor/circuit/gadgets.h"
#include "zkanchor/core/errors.h"
#include "zkanchor/merkle/merkle_tree.h"
#include "zkanchor/protocol/anchor.h"
#include "zkanchor/util/logging.h"

#include <optional>

namespace zkanchor {
namespace circuit {

namespace {

std::optional<FieldElement> ValueAt(const protocol::Witness* witness, size_t index) {
    if (witness == nullptr) {
        return std::nullopt;
    }
    return witness->Values()[index];
}

} // namespace

AnchoredRangeCircuit::AnchoredRangeCircuit(const protocol::ProtocolParams& params)
    : params_(params)
    , system_(BuildSystem(params)) {
    LOG_DEBUG(util::LogCategory::CIRCUIT) << "Anchored range circuit: "
        << system_.NumConstraints() << " constraints, "
        << system_.NumVariables() << " variables ("
        << system_.NumWitness() << " witness, " << system_.NumAux() << " aux)";
}

ConstraintSystem AnchoredRangeCircuit::BuildSystem(const protocol::ProtocolParams& params) {
    CircuitBuilder builder(params.Field(), false);
    Synthesize(builder, params, nullptr, nullptr);
    return builder.TakeSystem();
}

void AnchoredRangeCircuit::Synthesize(CircuitBuilder& builder,
                                      const protocol::ProtocolParams& params,
                                      const protocol::PublicInputs* publicInputs,
                                      const protocol::Witness* witness) {
    const PrimeField& field = params.Field();
    const size_t depth = params.Depth();
    const size_t rangeBits = params.RangeBits();

    std::vector<std::optional<FieldElement>> publicValues(protocol::PublicInputs::COUNT);
    if (publicInputs != nullptr) {
        publicValues = {publicInputs->anchor, publicInputs->lo, publicInputs->hi};
    }

    Variable anchor = builder.Allocate(VariableKind::Public, "anchor", publicValues[0]);
    Variable lo = builder.Allocate(VariableKind::Public, "lo", publicValues[1]);
    Variable hi = builder.Allocate(VariableKind::Public, "hi", publicValues[2]);

    size_t index = 0;
    Variable leaf = builder.Allocate(VariableKind::Witness, "leaf", ValueAt(witness, index++));

    std::vector<Variable> siblings;
    siblings.reserve(depth);
    for (size_t i = 0; i < depth; ++i) {
        siblings.push_back(builder.Allocate(VariableKind::Witness,
                                            "sibling" + std::to_string(i),
                                            ValueAt(witness, index++)));
    }
    std::vector<Variable> directions;
    directions.reserve(depth);
    for (size_t i = 0; i < depth; ++i) {
        directions.push_back(builder.Allocate(VariableKind::Witness,
                                              "direction" + std::to_string(i),
                                              ValueAt(witness, index++)));
    }
    std::vector<Variable> lowBits;
    lowBits.reserve(rangeBits);
    for (size_t i = 0; i < rangeBits; ++i) {
        lowBits.push_back(builder.Allocate(VariableKind::Witness,
                                           "low" + std::to_string(i),
                                           ValueAt(witness, index++)));
    }
    std::vector<Variable> highBits;
    highBits.reserve(rangeBits);
    for (size_t i = 0; i < rangeBits; ++i) {
        highBits.push_back(builder.Allocate(VariableKind::Witness,
                                            "high" + std::to_string(i),
                                            ValueAt(witness, index++)));
    }

    MerkleHasher merkleHasher(field);
    LinearCombination root = MerkleRootGadget(builder,
                                              merkleHasher.Permutation().Constants(),
                                              merkleHasher.NodeDomain(),
                                              builder.Lc(leaf), siblings, directions);

    protocol::AnchorHasher anchorHasher(field);
    LinearCombination derived = PoseidonHashGadget(
        builder, anchorHasher.Permutation().Constants(), anchorHasher.Domain(),
        {root, builder.Lc(lo), builder.Lc(hi), builder.Constant(params.DomainTag())},
        "anchor");
    EnforceEqual(builder, derived, builder.Lc(anchor), "anchor.bind");

    RangeGadget(builder, builder.Lc(leaf), builder.Lc(lo), builder.Lc(hi),
                lowBits, highBits);
}

std::vector<FieldElement> AnchoredRangeCircuit::Assign(
        const protocol::PublicInputs& publicInputs,
        const protocol::Witness& witness) const {
    if (witness.Depth() != params_.Depth() || witness.RangeBits() != params_.RangeBits()) {
        throw WitnessError(WitnessError::Kind::ShapeMismatch,
                           "witness was built for D=" + std::to_string(witness.Depth()) +
                           ", B=" + std::to_string(witness.RangeBits()));
    }
    if (witness.Field() != params_.Field() || publicInputs.Field() != params_.Field()) {
        throw ConfigError(ConfigError::Kind::ParameterMismatch,
                          "circuit inputs belong to a different field");
    }

    ZKANCHOR_LOG_TIMER(util::LogCategory::CIRCUIT, "Circuit assignment");

    CircuitBuilder builder(params_.Field(), true);
    Synthesize(builder, params_, &publicInputs, &witness);

    std::vector<FieldElement> assignment = builder.TakeAssignment();
    if (assignment.size() != system_.NumVariables()) {
        throw WitnessError(WitnessError::Kind::ShapeMismatch,
                           "assignment has " + std::to_string(assignment.size()) +
                           " values, circuit has " +
                           std::to_string(system_.NumVariables()) + " variables");
    }
    return assignment;
}

std::vector<FieldElement> AnchoredRangeCircuit::PublicAssignment(
        const protocol::PublicInputs& publicInputs) {
    return {publicInputs.Field().One(), publicInputs.anchor,
            publicInputs.lo, publicInputs.hi};
}

} // namespace circuit
} // namespace zkanchor
