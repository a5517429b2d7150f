// Copyright (c) 2024 FoldChain
// Distributed under the MIT software license

#include "accumulator/epoch.hpp"
#include "util/logging.hpp"

namespace foldchain {
namespace accumulator {

int EpochLength(size_t domain_size) {
  return static_cast<int>(domain_size / 2) - 1;
}

int EpochOf(int height, size_t domain_size) {
  return height / EpochLength(domain_size);
}

int EpochStartHeight(int height, size_t domain_size) {
  return EpochOf(height, domain_size) * EpochLength(domain_size);
}

int EpochEndHeight(int height, size_t domain_size) {
  return EpochStartHeight(height, domain_size) + EpochLength(domain_size) - 1;
}

AccumulatorState NextAccumulatorState(const AccumulatorState &parent_state,
                                      int height, const FieldElement &digest,
                                      size_t domain_size) {
  if (height == 0) {
    return AccumulatorState::Empty(domain_size).Append(digest);
  }

  if (parent_state.DomainSize() != domain_size) {
    throw ProofError(ProofError::Code::SizeMismatch,
                     "parent accumulator domain " +
                         std::to_string(parent_state.DomainSize()) +
                         " != " + std::to_string(domain_size));
  }

  if (height % EpochLength(domain_size) == 0) {
    const FieldElement checkpoint = parent_state.GetCheckpointDigest();
    LOG_ACCUM_DEBUG("Epoch {} starts at height {} (checkpoint {})",
                    EpochOf(height, domain_size), height,
                    checkpoint.ToString());
    return AccumulatorState::Empty(domain_size).Append(checkpoint).Append(
        digest);
  }
  return parent_state.Append(digest);
}

} // namespace accumulator
} // namespace foldchain
