// Copyright (c) 2024 FoldChain
// Distributed under the MIT software license

#include "chain/block_store.hpp"

namespace foldchain {
namespace chain {

std::optional<std::vector<uint8_t>>
MemoryBlockStore::Get(const std::string &key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool MemoryBlockStore::Put(const std::string &key,
                           const std::vector<uint8_t> &value) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_[key] = value;
  return true;
}

bool MemoryBlockStore::Erase(const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.erase(key) > 0;
}

bool MemoryBlockStore::Has(const std::string &key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.count(key) > 0;
}

size_t MemoryBlockStore::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

} // namespace chain
} // namespace foldchain
