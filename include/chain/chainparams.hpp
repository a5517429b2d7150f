// Copyright (c) 2024 FoldChain
// Distributed under the MIT software license

#ifndef FOLDCHAIN_CHAIN_CHAINPARAMS_HPP
#define FOLDCHAIN_CHAIN_CHAINPARAMS_HPP

#include "chain/uint.hpp"
#include "primitives/block.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace foldchain {
namespace chain {

enum class ChainType {
  MAIN,    // Production mainnet
  TESTNET, // Public test network
  REGTEST  // Regression test (local testing)
};

/**
 * Consensus parameters
 *
 * Density is the plain fraction (blocks in window) / nWindowSize.
 */
struct ConsensusParams {
  // Density window W, in slots
  uint64_t nWindowSize{20};

  // Canonical blocks buried this deep are final
  int nConfirmationDepth{6};

  // Blocks may be at most this many slots ahead of the local slot clock
  uint64_t nMaxFutureSlots{2};

  // Seconds per slot
  int64_t nSlotDuration{6};

  // Unix time of slot 0
  int64_t nGenesisTime{0};

  // Accumulator evaluation domain N (capacity N/2 digests)
  size_t nAccumulatorDomainSize{256};

  uint256 hashGenesisBlock;

  // Slot number at Unix time `now`, 0 before genesis
  uint64_t SlotAt(int64_t now) const;
};

// Regtest knobs; unset fields keep the regtest defaults
struct ConsensusOverrides {
  std::optional<uint64_t> window_size;
  std::optional<int> confirmation_depth;
  std::optional<uint64_t> max_future_slots;
  std::optional<int64_t> slot_duration;
  std::optional<int64_t> genesis_time;
  std::optional<size_t> accumulator_domain_size;
};

/**
 * ChainParams - per-network parameters and genesis block
 *
 * Instances are passed explicitly to the chainstate; there is no global
 * selection. Constructors throw std::invalid_argument for inconsistent
 * parameters.
 */
class ChainParams {
public:
  ChainParams() = default;
  virtual ~ChainParams() = default;

  const ConsensusParams &GetConsensus() const { return consensus; }
  const CBlock &GenesisBlock() const { return genesis; }
  ChainType GetChainType() const { return chainType; }
  std::string GetChainTypeString() const;

  static std::unique_ptr<ChainParams> CreateMainNet();
  static std::unique_ptr<ChainParams> CreateTestNet();
  static std::unique_ptr<ChainParams>
  CreateRegTest(const ConsensusOverrides &overrides = {});

protected:
  // Validate consensus, then build the genesis block and record its hash
  void Finish(const std::string &genesis_message);

  ConsensusParams consensus;
  ChainType chainType{ChainType::MAIN};
  CBlock genesis;
};

class CMainParams : public ChainParams {
public:
  CMainParams();
};

class CTestNetParams : public ChainParams {
public:
  CTestNetParams();
};

class CRegTestParams : public ChainParams {
public:
  explicit CRegTestParams(const ConsensusOverrides &overrides = {});
};

// Genesis: slot 0, null parent, one payload record, accumulator holding only
// its own digest
CBlock CreateGenesisBlock(const std::string &message, size_t domain_size);

} // namespace chain
} // namespace foldchain

#endif // FOLDCHAIN_CHAIN_CHAINPARAMS_HPP
