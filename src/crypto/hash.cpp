#include <cann/common/critical.hpp>
#include <cann/crypto/hash.hpp>

#include <openssl/evp.h>

#include <memory>

namespace cann::crypto {

namespace {

using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

cann::schema::hash32_t digest_sha256(const uint8_t* data, const size_t size) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    cann::common::critical("failed to allocate EVP_MD_CTX");
  }
  auto out = cann::schema::hash32_t{};
  auto length = 0u;
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), data, size) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), out.data(), &length) != 1 ||
      length != out.size()) {
    cann::common::critical("sha256 digest of {} bytes failed", size);
  }
  return out;
}

}  // namespace

cann::schema::hash32_t sha256(const cann::schema::bytes_view_t& bytes) {
  return digest_sha256(bytes.data(), bytes.size());
}

cann::schema::hash32_t sha256(const std::string_view& str) {
  return digest_sha256(reinterpret_cast<const uint8_t*>(str.data()),
                       str.size());
}

cann::schema::hash32_t hash256(const cann::schema::bytes_view_t& bytes) {
  auto first = sha256(bytes);
  return digest_sha256(first.data(), first.size());
}

}  // namespace cann::crypto
