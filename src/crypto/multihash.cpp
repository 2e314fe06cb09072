#include "castore/crypto/multihash.hpp"
#include "castore/cas/cas_error.hpp"
#include <boost/log/trivial.hpp>
#include <openssl/evp.h>

namespace castore {
namespace crypto {

namespace {

const EVP_MD* evp_for(HashAlgorithm algorithm) {
  switch (algorithm) {
    case HashAlgorithm::SHA1: return EVP_sha1();
    case HashAlgorithm::SHA2_256: return EVP_sha256();
    case HashAlgorithm::SHA2_512: return EVP_sha512();
    case HashAlgorithm::SHA3_256: return EVP_sha3_256();
  }
  throw cas::DigestError("unsupported hash algorithm");
}

} // namespace

const char* hash_algorithm_to_string(HashAlgorithm algorithm) {
  switch (algorithm) {
    case HashAlgorithm::SHA1: return "sha1";
    case HashAlgorithm::SHA2_256: return "sha2-256";
    case HashAlgorithm::SHA2_512: return "sha2-512";
    case HashAlgorithm::SHA3_256: return "sha3-256";
    default: return "unknown";
  }
}

std::optional<HashAlgorithm> hash_algorithm_from_code(uint8_t code) {
  switch (code) {
    case static_cast<uint8_t>(HashAlgorithm::SHA1): return HashAlgorithm::SHA1;
    case static_cast<uint8_t>(HashAlgorithm::SHA2_256): return HashAlgorithm::SHA2_256;
    case static_cast<uint8_t>(HashAlgorithm::SHA2_512): return HashAlgorithm::SHA2_512;
    case static_cast<uint8_t>(HashAlgorithm::SHA3_256): return HashAlgorithm::SHA3_256;
    default: return std::nullopt;
  }
}

std::size_t digest_size(HashAlgorithm algorithm) {
  switch (algorithm) {
    case HashAlgorithm::SHA1: return 20;
    case HashAlgorithm::SHA2_256: return 32;
    case HashAlgorithm::SHA2_512: return 64;
    case HashAlgorithm::SHA3_256: return 32;
  }
  return 0;
}


//==============================================
// DIGEST
//==============================================

std::vector<uint8_t> digest(HashAlgorithm algorithm, const std::string& data) {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;

  // Throws for an unsupported algorithm, before the context exists
  const EVP_MD* md = evp_for(algorithm);

  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  if (!ctx) {
    BOOST_LOG_TRIVIAL(error) << "Multihash: Failed to create digest context";
    throw cas::DigestError("failed to create digest context");
  }

  if (!EVP_DigestInit_ex(ctx, md, nullptr)) {
    EVP_MD_CTX_free(ctx);
    throw cas::DigestError(std::string("failed to initialize ") + hash_algorithm_to_string(algorithm));
  }

  if (!EVP_DigestUpdate(ctx, data.data(), data.size())) {
    EVP_MD_CTX_free(ctx);
    throw cas::DigestError("failed to update digest");
  }

  if (!EVP_DigestFinal_ex(ctx, hash, &hash_len)) {
    EVP_MD_CTX_free(ctx);
    throw cas::DigestError("failed to finalize digest");
  }

  EVP_MD_CTX_free(ctx);
  return std::vector<uint8_t>(hash, hash + hash_len);
}


//==============================================
// MULTIHASH FRAMING
//==============================================

std::vector<uint8_t> encode_multihash(const Multihash& multihash) {
  std::vector<uint8_t> bytes;
  bytes.reserve(multihash.digest.size() + 2);
  bytes.push_back(static_cast<uint8_t>(multihash.algorithm));
  bytes.push_back(static_cast<uint8_t>(multihash.digest.size()));
  bytes.insert(bytes.end(), multihash.digest.begin(), multihash.digest.end());
  return bytes;
}

std::optional<Multihash> decode_multihash(const std::vector<uint8_t>& bytes) {
  if (bytes.size() < 2) {
    return std::nullopt;
  }

  auto algorithm = hash_algorithm_from_code(bytes[0]);
  if (!algorithm) {
    return std::nullopt;
  }

  const std::size_t length = bytes[1];
  if (length != digest_size(*algorithm) || bytes.size() != length + 2) {
    return std::nullopt;
  }

  return Multihash{*algorithm, std::vector<uint8_t>(bytes.begin() + 2, bytes.end())};
}

} // namespace crypto
} // namespace castore
