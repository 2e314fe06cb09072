#ifndef CASTORE_CRYPTO_BASE58_HPP
#define CASTORE_CRYPTO_BASE58_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace castore {
namespace crypto {

// Bitcoin alphabet, no checksum
std::string to_base58(const std::vector<uint8_t>& data);

// Returns std::nullopt if the text contains a character outside the alphabet
std::optional<std::vector<uint8_t>> from_base58(const std::string& text);

} // namespace crypto
} // namespace castore

#endif // CASTORE_CRYPTO_BASE58_HPP
