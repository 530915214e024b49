#include "digest.hpp"

#include <openssl/evp.h>

#include <memory>
#include <stdexcept>

#include "internal/util/hex.hpp"

namespace gate::crypto {

namespace {

struct EvpMdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
  }
};

} // namespace

Sha256Digest Sha256(std::string_view data) {
  std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx) throw std::runtime_error("EVP_MD_CTX_new failed");
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }
  if (!data.empty() && EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }

  Sha256Digest digest{};
  unsigned int out_len = 0;
  if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &out_len) != 1 || out_len != digest.size()) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  return digest;
}

std::string Sha256Hex(std::string_view data) {
  const auto digest = Sha256(data);
  return util::HexEncode(digest.data(), digest.size());
}

} // namespace gate::crypto
