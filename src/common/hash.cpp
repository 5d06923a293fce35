#include "domshield/common/hash.hpp"

#include <openssl/evp.h>
#include <openssl/sha.h>

namespace domshield::common {

std::string sha256_hex(std::string_view data) {
  unsigned char hash[SHA256_DIGEST_LENGTH];
  unsigned int hash_len = 0;

  EVP_MD_CTX *ctx = EVP_MD_CTX_new();
  if (ctx == nullptr) {
    return "";
  }
  const bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1 &&
                  EVP_DigestUpdate(ctx, data.data(), data.size()) == 1 &&
                  EVP_DigestFinal_ex(ctx, hash, &hash_len) == 1;
  EVP_MD_CTX_free(ctx);
  if (!ok) {
    return "";
  }

  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(static_cast<std::size_t>(hash_len) * 2);
  for (unsigned int i = 0; i < hash_len; ++i) {
    out.push_back(kHex[hash[i] >> 4]);
    out.push_back(kHex[hash[i] & 0x0f]);
  }
  return out;
}

} // namespace domshield::common
