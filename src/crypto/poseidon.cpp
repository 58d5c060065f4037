// ZKANCHOR - Poseidon Hash Implementation
// Copyright (c) 2024 ZKANCHOR Developers
// MIT License

#include "zkanchor/crypto/poseidon.h"

#include "zkanchor/core/errors.h"
#include "zkanchor/crypto/sha256.h"
#include "zkanchor/util/logging.h"

#include <map>
#include <memory>
#include <mutex>
#include <tuple>

namespace zkanchor {

namespace PoseidonParams {
    const PoseidonConfig CONFIG_2_1{3, 8, 57, 1};
    const PoseidonConfig CONFIG_4_1{5, 8, 60, 1};
}

namespace {

constexpr size_t MAX_DOMAIN_LABEL = 31;

/// Round constants from a SHA-256 chain seeded with the modulus and shape
std::vector<std::vector<FieldElement>> GenerateRoundConstants(
        const PrimeField& field, const PoseidonConfig& config) {
    const std::string domain = "ZKANCHOR_POSEIDON_RC";

    ByteVector seedInput(domain.begin(), domain.end());
    auto modulusBytes = field.Modulus().ToBytes();
    seedInput.insert(seedInput.end(), modulusBytes.begin(), modulusBytes.end());
    WriteLE64(seedInput, config.width);
    WriteLE64(seedInput, config.fullRounds);
    WriteLE64(seedInput, config.partialRounds);

    Sha256Digest seed = SHA256Hash(seedInput);

    std::vector<std::vector<FieldElement>> constants;
    constants.reserve(config.totalRounds());

    SHA256 hasher;
    uint64_t counter = 0;
    for (size_t r = 0; r < config.totalRounds(); ++r) {
        std::vector<FieldElement> round;
        round.reserve(config.width);
        for (size_t i = 0; i < config.width; ++i) {
            ByteVector counterBytes;
            WriteLE64(counterBytes, counter++);

            Sha256Digest hash;
            hasher.Reset().Write(seed.data(), seed.size()).Write(counterBytes);
            hasher.Finalize(hash.data());

            round.push_back(field.FromBytesReduce(hash.data(), hash.size()));
            seed = hash;
        }
        constants.push_back(std::move(round));
    }
    return constants;
}

/// Cauchy matrix M[i][j] = 1 / (x_i + y_j), x_i = i, y_j = width + j
std::vector<std::vector<FieldElement>> GenerateMDSMatrix(
        const PrimeField& field, size_t width) {
    std::vector<std::vector<FieldElement>> mds;
    mds.reserve(width);
    for (size_t i = 0; i < width; ++i) {
        std::vector<FieldElement> row;
        row.reserve(width);
        for (size_t j = 0; j < width; ++j) {
            row.push_back(field.FromUint64(i + width + j).Inverse());
        }
        mds.push_back(std::move(row));
    }
    return mds;
}

using ConstantsKey = std::tuple<const PrimeField*, size_t, size_t, size_t, size_t>;

struct ConstantsRegistry {
    std::mutex mutex;
    std::map<ConstantsKey, std::unique_ptr<PoseidonConstants>> entries;
};

ConstantsRegistry& Registry() {
    static ConstantsRegistry registry;
    return registry;
}

} // namespace

// ============================================================================
// Constants
// ============================================================================

const PoseidonConstants& PoseidonConstants::For(const PrimeField& field,
                                                const PoseidonConfig& config) {
    ConstantsKey key{&field, config.width, config.fullRounds,
                     config.partialRounds, config.capacity};

    ConstantsRegistry& registry = Registry();
    std::lock_guard<std::mutex> lock(registry.mutex);

    auto it = registry.entries.find(key);
    if (it != registry.entries.end()) {
        return *it->second;
    }

    if (config.width < 2 || config.capacity == 0 || config.capacity >= config.width ||
        config.fullRounds % 2 != 0) {
        throw ConfigError(ConfigError::Kind::InvalidParameter,
                          "malformed Poseidon configuration");
    }
    // x^5 permutes F_p iff gcd(5, p - 1) = 1, i.e. p != 1 (mod 5)
    if (field.Modulus().ModSmall(5) == 1) {
        throw ConfigError(ConfigError::Kind::InvalidParameter,
                          "x^5 is not a permutation of the " + field.Name() + " field");
    }
    if (field.Modulus() <= Uint256(static_cast<uint64_t>(3 * config.width))) {
        throw ConfigError(ConfigError::Kind::InvalidParameter,
                          "field too small for a Poseidon MDS matrix");
    }

    ZKANCHOR_LOG_TIMER(util::LogCategory::POSEIDON, "Poseidon constant derivation");

    std::unique_ptr<PoseidonConstants> constants(new PoseidonConstants{
        &field, config,
        GenerateRoundConstants(field, config),
        GenerateMDSMatrix(field, config.width)});

    LOG_DEBUG(util::LogCategory::POSEIDON) << "Derived constants for width "
        << config.width << " (" << config.fullRounds << "+"
        << config.partialRounds << " rounds) over " << field.Name();

    const PoseidonConstants& ref = *constants;
    registry.entries.emplace(key, std::move(constants));
    return ref;
}

FieldElement PoseidonDomain(const PrimeField& field, const std::string& label) {
    if (label.empty() || label.size() > MAX_DOMAIN_LABEL) {
        throw ConfigError(ConfigError::Kind::InvalidParameter,
                          "domain label must be 1 to 31 bytes: '" + label + "'");
    }
    Uint256 value(reinterpret_cast<const Byte*>(label.data()), label.size());
    return field.Reduce(value);
}

// ============================================================================
// Poseidon Implementation
// ============================================================================

Poseidon::Poseidon(const PrimeField& field, const PoseidonConfig& config)
    : constants_(&PoseidonConstants::For(field, config)) {}

void Poseidon::AddRoundConstants(std::vector<FieldElement>& state,
                                 size_t roundIdx) const {
    const auto& rc = constants_->roundConstants[roundIdx];
    for (size_t i = 0; i < state.size(); ++i) {
        state[i] = state[i] + rc[i];
    }
}

void Poseidon::MixColumns(std::vector<FieldElement>& state) const {
    const auto& mds = constants_->mds;
    std::vector<FieldElement> mixed;
    mixed.reserve(state.size());

    for (size_t i = 0; i < state.size(); ++i) {
        FieldElement acc = mds[i][0] * state[0];
        for (size_t j = 1; j < state.size(); ++j) {
            acc = acc + mds[i][j] * state[j];
        }
        mixed.push_back(acc);
    }
    state = std::move(mixed);
}

void Poseidon::FullRound(std::vector<FieldElement>& state, size_t roundIdx) const {
    AddRoundConstants(state, roundIdx);
    for (auto& lane : state) {
        lane = lane.PoseidonSbox();
    }
    MixColumns(state);
}

void Poseidon::PartialRound(std::vector<FieldElement>& state, size_t roundIdx) const {
    AddRoundConstants(state, roundIdx);
    state[0] = state[0].PoseidonSbox();
    MixColumns(state);
}

void Poseidon::Permute(std::vector<FieldElement>& state) const {
    const PoseidonConfig& config = constants_->config;
    if (state.size() != config.width) {
        throw ConfigError(ConfigError::Kind::ParameterMismatch,
                          "Poseidon state has " + std::to_string(state.size()) +
                          " lanes, expected " + std::to_string(config.width));
    }

    size_t roundIdx = 0;
    size_t halfFullRounds = config.fullRounds / 2;

    for (size_t i = 0; i < halfFullRounds; ++i) {
        FullRound(state, roundIdx++);
    }
    for (size_t i = 0; i < config.partialRounds; ++i) {
        PartialRound(state, roundIdx++);
    }
    for (size_t i = 0; i < halfFullRounds; ++i) {
        FullRound(state, roundIdx++);
    }
}

FieldElement Poseidon::Hash(const FieldElement& domain,
                            const std::vector<FieldElement>& inputs) const {
    const PoseidonConfig& config = constants_->config;
    if (inputs.size() != config.rate()) {
        throw ConfigError(ConfigError::Kind::ParameterMismatch,
                          "Poseidon width " + std::to_string(config.width) +
                          " takes " + std::to_string(config.rate()) +
                          " inputs, got " + std::to_string(inputs.size()));
    }
    if (domain.Field() != Field()) {
        throw ConfigError(ConfigError::Kind::ParameterMismatch,
                          "domain tag belongs to a different field");
    }

    std::vector<FieldElement> state(inputs);
    for (size_t i = 0; i < config.capacity; ++i) {
        state.push_back(i == 0 ? domain : Field().Zero());
    }
    Permute(state);
    return state[0];
}

FieldElement Poseidon::Hash2(const FieldElement& domain,
                             const FieldElement& left,
                             const FieldElement& right) const {
    return Hash(domain, {left, right});
}

} // namespace zkanchor
