// Copyright (c) 2024 FoldChain
// Distributed under the MIT software license

#ifndef FOLDCHAIN_CHAIN_BLOCK_STORE_HPP
#define FOLDCHAIN_CHAIN_BLOCK_STORE_HPP

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace foldchain {
namespace chain {

/**
 * BlockStore - key/value persistence capability
 *
 * The chain core does not own a storage engine. Whoever embeds it injects a
 * BlockStore; BlockManager writes serialized blocks and a chain metadata
 * document through it and replays them on Load().
 *
 * Implementations must be safe to call from one writer thread while other
 * threads read.
 */
class BlockStore {
public:
  virtual ~BlockStore() = default;

  virtual std::optional<std::vector<uint8_t>> Get(const std::string &key) const = 0;
  virtual bool Put(const std::string &key, const std::vector<uint8_t> &value) = 0;
  // Returns false if the key was absent
  virtual bool Erase(const std::string &key) = 0;
  virtual bool Has(const std::string &key) const = 0;
};

// In-memory store, used by tests and by embedders that persist elsewhere
class MemoryBlockStore : public BlockStore {
public:
  std::optional<std::vector<uint8_t>> Get(const std::string &key) const override;
  bool Put(const std::string &key, const std::vector<uint8_t> &value) override;
  bool Erase(const std::string &key) override;
  bool Has(const std::string &key) const override;

  size_t Size() const;

private:
  mutable std::mutex mutex_;
  std::map<std::string, std::vector<uint8_t>> entries_;
};

} // namespace chain
} // namespace foldchain

#endif // FOLDCHAIN_CHAIN_BLOCK_STORE_HPP
