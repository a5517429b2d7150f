// Copyright (c) 2024 FoldChain
// Distributed under the MIT software license

#include "crypto/sha256.hpp"
#include <algorithm>
#include <openssl/evp.h>
#include <stdexcept>

namespace foldchain {
namespace crypto {

void CSHA256::CtxDeleter::operator()(evp_md_ctx_st *ctx) const {
  EVP_MD_CTX_free(ctx);
}

CSHA256::CSHA256() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }
  Reset();
}

CSHA256::~CSHA256() = default;

CSHA256 &CSHA256::Write(const uint8_t *data, size_t len) {
  if (len == 0) {
    return *this;
  }
  if (EVP_DigestUpdate(ctx_.get(), data, len) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
  return *this;
}

void CSHA256::Finalize(uint8_t hash[OUTPUT_SIZE]) {
  unsigned int out_len = 0;
  if (EVP_DigestFinal_ex(ctx_.get(), hash, &out_len) != 1 ||
      out_len != OUTPUT_SIZE) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
}

CSHA256 &CSHA256::Reset() {
  if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }
  return *this;
}

uint256 Sha256(std::span<const uint8_t> data) {
  uint8_t h[CSHA256::OUTPUT_SIZE];
  CSHA256().Write(data).Finalize(h);

  // SHA-256 output is big-endian; uint256 stores little-endian
  uint256 out;
  std::reverse_copy(h, h + CSHA256::OUTPUT_SIZE, out.begin());
  return out;
}

uint256 Hash256(std::span<const uint8_t> data) {
  uint8_t h1[CSHA256::OUTPUT_SIZE], h2[CSHA256::OUTPUT_SIZE];
  CSHA256().Write(data).Finalize(h1);
  CSHA256().Write(h1, sizeof(h1)).Finalize(h2);

  uint256 out;
  std::reverse_copy(h2, h2 + CSHA256::OUTPUT_SIZE, out.begin());
  return out;
}

} // namespace crypto
} // namespace foldchain
