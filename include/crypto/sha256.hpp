// Copyright (c) 2024 FoldChain
// Distributed under the MIT software license

#ifndef FOLDCHAIN_CRYPTO_SHA256_HPP
#define FOLDCHAIN_CRYPTO_SHA256_HPP

#include "chain/uint.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

// OpenSSL digest context (opaque)
struct evp_md_ctx_st;

namespace foldchain {
namespace crypto {

/**
 * CSHA256 - incremental SHA-256 hasher backed by OpenSSL's EVP interface
 *
 * Usage:
 *   uint8_t out[CSHA256::OUTPUT_SIZE];
 *   CSHA256().Write(data, len).Write(more, more_len).Finalize(out);
 *
 * OpenSSL failures are not recoverable and throw std::runtime_error.
 */
class CSHA256 {
public:
  static constexpr size_t OUTPUT_SIZE = 32;

  CSHA256();
  ~CSHA256();

  CSHA256(const CSHA256 &) = delete;
  CSHA256 &operator=(const CSHA256 &) = delete;

  CSHA256 &Write(const uint8_t *data, size_t len);
  CSHA256 &Write(std::span<const uint8_t> data) {
    return Write(data.data(), data.size());
  }
  void Finalize(uint8_t hash[OUTPUT_SIZE]);
  CSHA256 &Reset();

private:
  struct CtxDeleter {
    void operator()(evp_md_ctx_st *ctx) const;
  };
  std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
};

// Single SHA-256, digest bytes reversed into uint256 internal order
uint256 Sha256(std::span<const uint8_t> data);

// Double SHA-256 (block identifiers), same byte order as Sha256()
uint256 Hash256(std::span<const uint8_t> data);

} // namespace crypto
} // namespace foldchain

#endif // FOLDCHAIN_CRYPTO_SHA256_HPP
