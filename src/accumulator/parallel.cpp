// Copyright (c) 2024 FoldChain
// Distributed under the MIT software license

#include "accumulator/parallel.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <future>

namespace foldchain {
namespace accumulator {

AccumulatorState AccumulateParallel(std::span<const FieldElement> digests,
                                    util::ThreadPool &pool, size_t domain_size,
                                    size_t min_slice) {
  if (digests.size() > domain_size / 2) {
    throw ProofError(ProofError::Code::DegreeExceeded,
                     std::to_string(digests.size()) +
                         " digests exceed degree bound " +
                         std::to_string(domain_size / 2));
  }
  if (min_slice == 0) {
    min_slice = 1;
  }

  const size_t by_size = (digests.size() + min_slice - 1) / min_slice;
  const size_t slices = std::max<size_t>(1, std::min(pool.size(), by_size));
  if (slices == 1) {
    return Accumulate(digests, domain_size);
  }

  const size_t per_slice = (digests.size() + slices - 1) / slices;
  std::vector<std::future<AccumulatorState>> futures;
  futures.reserve(slices);
  for (size_t begin = 0; begin < digests.size(); begin += per_slice) {
    const size_t end = std::min(digests.size(), begin + per_slice);
    std::vector<FieldElement> slice(digests.begin() + begin,
                                    digests.begin() + end);
    futures.push_back(pool.enqueue(
        [domain_size](std::vector<FieldElement> part) {
          return Accumulate(part, domain_size);
        },
        std::move(slice)));
  }

  std::vector<AccumulatorState> partials;
  partials.reserve(futures.size());
  for (auto &f : futures) {
    partials.push_back(f.get());
  }

  LOG_ACCUM_TRACE("Accumulated {} digests in {} slices", digests.size(),
                  partials.size());
  return FoldAll(std::move(partials), pool, domain_size);
}

AccumulatorState FoldAll(std::vector<AccumulatorState> states,
                         util::ThreadPool &pool, size_t domain_size) {
  if (states.empty()) {
    return AccumulatorState::Empty(domain_size);
  }

  while (states.size() > 1) {
    std::vector<std::future<AccumulatorState>> round;
    round.reserve(states.size() / 2);
    for (size_t i = 0; i + 1 < states.size(); i += 2) {
      round.push_back(pool.enqueue(
          [](const AccumulatorState &a, const AccumulatorState &b) {
            return a.Fold(b);
          },
          std::move(states[i]), std::move(states[i + 1])));
    }

    std::vector<AccumulatorState> next;
    next.reserve(round.size() + 1);
    for (auto &f : round) {
      next.push_back(f.get());
    }
    // Odd one out carries to the next round
    if (states.size() % 2 == 1) {
      next.push_back(std::move(states.back()));
    }
    states = std::move(next);
  }
  return std::move(states.front());
}

} // namespace accumulator
} // namespace foldchain
