#ifndef CASTORE_CRYPTO_MULTIHASH_HPP
#define CASTORE_CRYPTO_MULTIHASH_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace castore {
namespace crypto {

// Digest algorithms, valued by their multihash code
enum class HashAlgorithm : uint8_t {
  SHA1 = 0x11,
  SHA2_256 = 0x12,
  SHA2_512 = 0x13,
  SHA3_256 = 0x16
};

// Used by AddressableContent::address() when a type has no rule of its own
constexpr HashAlgorithm DEFAULT_HASH_ALGORITHM = HashAlgorithm::SHA2_256;

const char* hash_algorithm_to_string(HashAlgorithm algorithm);

// Maps a multihash code byte back to a supported algorithm
std::optional<HashAlgorithm> hash_algorithm_from_code(uint8_t code);

// Digest length in bytes
std::size_t digest_size(HashAlgorithm algorithm);


// ---- DIGEST ----
// Hashes data with OpenSSL EVP, throws cas::DigestError on failure
std::vector<uint8_t> digest(HashAlgorithm algorithm, const std::string& data);


// ---- MULTIHASH FRAMING ----
// <code><length><digest>
struct Multihash {
  HashAlgorithm algorithm;
  std::vector<uint8_t> digest;
};

std::vector<uint8_t> encode_multihash(const Multihash& multihash);
// Returns std::nullopt on unknown code or length mismatch
std::optional<Multihash> decode_multihash(const std::vector<uint8_t>& bytes);

} // namespace crypto
} // namespace castore

#endif // CASTORE_CRYPTO_MULTIHASH_HPP
