// ZKANCHOR - Circuit Gadgets Implementation
// Copyright (c) 2024 ZKANCHOR Developers
// MIT License

#include "zkanchor/circuit/gadgets.h"

#include "zkanchor/core/errors.h"

namespace zkanchor {
namespace circuit {

namespace {

/// Allocate an aux variable whose value is a * b (when values are tracked)
Variable AllocateProduct(CircuitBuilder& builder,
                         const LinearCombination& a,
                         const LinearCombination& b,
                         const std::string& name) {
    std::optional<FieldElement> value;
    if (builder.HasValues()) {
        value = *builder.Evaluate(a) * *builder.Evaluate(b);
    }
    Variable out = builder.Allocate(VariableKind::Aux, name, value);
    builder.Enforce(a, b, builder.Lc(out), name);
    return out;
}

std::vector<LinearCombination> MixColumns(const PoseidonConstants& constants,
                                          const std::vector<LinearCombination>& state) {
    std::vector<LinearCombination> mixed;
    mixed.reserve(state.size());
    for (size_t i = 0; i < state.size(); ++i) {
        LinearCombination acc(*constants.field);
        for (size_t j = 0; j < state.size(); ++j) {
            acc = acc + state[j] * constants.mds[i][j];
        }
        mixed.push_back(std::move(acc));
    }
    return mixed;
}

} // namespace

void EnforceBoolean(CircuitBuilder& builder, const LinearCombination& x,
                    const std::string& annotation) {
    LinearCombination xMinusOne = x;
    xMinusOne.AddConstant(-builder.Field().One());
    builder.Enforce(x, xMinusOne, LinearCombination(builder.Field()), annotation);
}

void EnforceEqual(CircuitBuilder& builder, const LinearCombination& lhs,
                  const LinearCombination& rhs, const std::string& annotation) {
    builder.Enforce(lhs, builder.Lc(Variable::One()), rhs, annotation);
}

LinearCombination PoseidonSboxGadget(CircuitBuilder& builder,
                                     const LinearCombination& x,
                                     const std::string& annotation) {
    Variable x2 = AllocateProduct(builder, x, x, annotation + ".x2");
    Variable x4 = AllocateProduct(builder, builder.Lc(x2), builder.Lc(x2),
                                  annotation + ".x4");
    Variable x5 = AllocateProduct(builder, builder.Lc(x4), x, annotation + ".x5");
    return builder.Lc(x5);
}

std::vector<LinearCombination> PoseidonPermutationGadget(
        CircuitBuilder& builder,
        const PoseidonConstants& constants,
        std::vector<LinearCombination> state,
        const std::string& annotation) {
    const PoseidonConfig& config = constants.config;
    if (state.size() != config.width) {
        throw ConfigError(ConfigError::Kind::ParameterMismatch,
                          "Poseidon gadget state has " + std::to_string(state.size()) +
                          " lanes, expected " + std::to_string(config.width));
    }

    const size_t halfFull = config.fullRounds / 2;
    const size_t total = config.totalRounds();

    for (size_t round = 0; round < total; ++round) {
        const bool full = round < halfFull || round >= halfFull + config.partialRounds;
        const std::string prefix = annotation + ".r" + std::to_string(round);

        for (size_t lane = 0; lane < state.size(); ++lane) {
            state[lane].AddConstant(constants.roundConstants[round][lane]);
        }
        if (full) {
            for (size_t lane = 0; lane < state.size(); ++lane) {
                state[lane] = PoseidonSboxGadget(builder, state[lane],
                                                 prefix + ".s" + std::to_string(lane));
            }
        } else {
            state[0] = PoseidonSboxGadget(builder, state[0], prefix + ".s0");
        }
        state = MixColumns(constants, state);
    }
    return state;
}

LinearCombination PoseidonHashGadget(CircuitBuilder& builder,
                                     const PoseidonConstants& constants,
                                     const FieldElement& domain,
                                     const std::vector<LinearCombination>& inputs,
                                     const std::string& annotation) {
    const PoseidonConfig& config = constants.config;
    if (inputs.size() != config.rate()) {
        throw ConfigError(ConfigError::Kind::ParameterMismatch,
                          "Poseidon gadget takes " + std::to_string(config.rate()) +
                          " inputs, got " + std::to_string(inputs.size()));
    }

    std::vector<LinearCombination> state(inputs);
    for (size_t i = 0; i < config.capacity; ++i) {
        state.push_back(LinearCombination::Constant(
            i == 0 ? domain : constants.field->Zero()));
    }
    state = PoseidonPermutationGadget(builder, constants, std::move(state), annotation);
    return state[0];
}

LinearCombination MerkleLevelGadget(CircuitBuilder& builder,
                                    const PoseidonConstants& nodeConstants,
                                    const FieldElement& nodeDomain,
                                    const LinearCombination& current,
                                    const LinearCombination& sibling,
                                    const LinearCombination& direction,
                                    const std::string& annotation) {
    EnforceBoolean(builder, direction, annotation + ".dir");

    // Conditional swap: direction 0 keeps (current, sibling), 1 swaps them
    LinearCombination diff = sibling - current;
    Variable t = AllocateProduct(builder, direction, diff, annotation + ".swap");

    LinearCombination left = current + builder.Lc(t);
    LinearCombination right = sibling - builder.Lc(t);
    return PoseidonHashGadget(builder, nodeConstants, nodeDomain, {left, right},
                              annotation + ".hash");
}

LinearCombination MerkleRootGadget(CircuitBuilder& builder,
                                   const PoseidonConstants& nodeConstants,
                                   const FieldElement& nodeDomain,
                                   const LinearCombination& leaf,
                                   const std::vector<Variable>& siblings,
                                   const std::vector<Variable>& directions) {
    if (siblings.size() != directions.size()) {
        throw WitnessError(WitnessError::Kind::ShapeMismatch,
                           "Merkle gadget given " + std::to_string(siblings.size()) +
                           " siblings and " + std::to_string(directions.size()) +
                           " directions");
    }

    LinearCombination current = leaf;
    for (size_t level = 0; level < siblings.size(); ++level) {
        current = MerkleLevelGadget(builder, nodeConstants, nodeDomain, current,
                                    builder.Lc(siblings[level]),
                                    builder.Lc(directions[level]),
                                    "merkle.l" + std::to_string(level));
    }
    return current;
}

void BitPackingGadget(CircuitBuilder& builder,
                      const std::vector<Variable>& bits,
                      const LinearCombination& target,
                      const std::string& annotation) {
    const PrimeField& field = builder.Field();

    LinearCombination packed(field);
    FieldElement power = field.One();
    for (size_t i = 0; i < bits.size(); ++i) {
        EnforceBoolean(builder, builder.Lc(bits[i]),
                       annotation + ".b" + std::to_string(i));
        packed.AddTerm(bits[i], power);
        power = power + power;
    }
    EnforceEqual(builder, packed, target, annotation + ".pack");
}

void RangeGadget(CircuitBuilder& builder,
                 const LinearCombination& value,
                 const LinearCombination& lo,
                 const LinearCombination& hi,
                 const std::vector<Variable>& lowBits,
                 const std::vector<Variable>& highBits) {
    if (lowBits.size() != highBits.size()) {
        throw WitnessError(WitnessError::Kind::ShapeMismatch,
                           "range gadget decompositions differ in width");
    }
    BitPackingGadget(builder, lowBits, value - lo, "range.low");
    BitPackingGadget(builder, highBits, hi - value, "range.high");
}

} // namespace circuit
} // namespace zkanchor
