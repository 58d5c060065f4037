// ZKANCHOR - Transparent Development Backend Implementation
// Copyright (c) 2024 ZKANCHOR Developers
// MIT License

#include "zkanchor/backend/transparent.h"

#include "zkanchor/core/errors.h"
#include "zkanchor/util/logging.h"

#include <cstring>

namespace zkanchor {
namespace backend {

ByteVector TransparentBackend::Prove(const circuit::ConstraintSystem& cs,
                                     const std::vector<FieldElement>& assignment) const {
    ZKANCHOR_LOG_TIMER(util::LogCategory::BACKEND, "Transparent prove");

    std::optional<size_t> failing = cs.FirstUnsatisfied(assignment);
    if (failing) {
        throw WitnessError(WitnessError::Kind::Unsatisfied,
                           "constraint " + std::to_string(*failing) + " (" +
                           cs.Constraints()[*failing].annotation + ") is violated");
    }

    const size_t offset = cs.PrivateOffset();
    const size_t count = assignment.size() - offset;
    const size_t width = cs.Field().ByteWidth();

    ByteVector blob;
    blob.reserve(SHA256::OUTPUT_SIZE + 4 + count * width);

    Sha256Digest digest = cs.ShapeDigest();
    blob.insert(blob.end(), digest.begin(), digest.end());
    WriteLE32(blob, static_cast<uint32_t>(count));
    for (size_t i = offset; i < assignment.size(); ++i) {
        ByteVector bytes = assignment[i].ToBytes();
        blob.insert(blob.end(), bytes.begin(), bytes.end());
    }

    LOG_DEBUG(util::LogCategory::BACKEND) << "Transparent proof over "
        << cs.NumConstraints() << " constraints, " << blob.size() << " bytes";
    return blob;
}

BackendVerdict TransparentBackend::Verify(const circuit::ConstraintSystem& cs,
                                          const std::vector<FieldElement>& publicInputs,
                                          const ByteVector& blob) const {
    const PrimeField& field = cs.Field();
    const size_t width = field.ByteWidth();

    if (publicInputs.size() != cs.NumPublic()) {
        return BackendVerdict::Reject("expected " + std::to_string(cs.NumPublic()) +
                                      " public inputs, got " +
                                      std::to_string(publicInputs.size()));
    }
    if (blob.size() < SHA256::OUTPUT_SIZE + 4) {
        return BackendVerdict::Reject("blob too short");
    }

    Sha256Digest digest = cs.ShapeDigest();
    if (std::memcmp(blob.data(), digest.data(), digest.size()) != 0) {
        return BackendVerdict::Reject("blob was produced for a different circuit");
    }

    const size_t count = ReadLE32(blob.data() + SHA256::OUTPUT_SIZE);
    if (count != cs.NumVariables() - cs.PrivateOffset() ||
        blob.size() != SHA256::OUTPUT_SIZE + 4 + count * width) {
        return BackendVerdict::Reject("blob does not match the circuit shape");
    }

    std::vector<FieldElement> assignment;
    assignment.reserve(cs.NumVariables());
    assignment.push_back(field.One());
    for (const auto& input : publicInputs) {
        if (input.Field() != field) {
            throw ConfigError(ConfigError::Kind::ParameterMismatch,
                              "public input belongs to a different field");
        }
        assignment.push_back(input);
    }

    const Byte* cursor = blob.data() + SHA256::OUTPUT_SIZE + 4;
    for (size_t i = 0; i < count; ++i, cursor += width) {
        try {
            assignment.push_back(field.FromBytes(cursor, width));
        } catch (const FieldError& e) {
            return BackendVerdict::Reject("private value " + std::to_string(i) +
                                          ": " + e.what());
        }
    }

    std::optional<size_t> failing = cs.FirstUnsatisfied(assignment);
    if (failing) {
        LOG_DEBUG(util::LogCategory::BACKEND) << "Transparent verify rejected at constraint "
            << *failing << " (" << cs.Constraints()[*failing].annotation << ")";
        return BackendVerdict::Reject("constraint " + std::to_string(*failing) + " (" +
                                      cs.Constraints()[*failing].annotation +
                                      ") is violated");
    }
    return BackendVerdict::Accept();
}

} // namespace backend
} // namespace zkanchor
