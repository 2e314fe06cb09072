#include "castore/crypto/base58.hpp"
#include <algorithm>

namespace castore {
namespace crypto {

namespace {

constexpr char ALPHABET[] = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

int alphabet_index(char c) {
  const char* end = ALPHABET + 58;
  const char* pos = std::find(ALPHABET, end, c);
  return pos == end ? -1 : static_cast<int>(pos - ALPHABET);
}

} // namespace

std::string to_base58(const std::vector<uint8_t>& data) {
  // Each leading zero byte maps to a leading '1'
  std::size_t zeros = 0;
  while (zeros < data.size() && data[zeros] == 0) {
    ++zeros;
  }

  // Base58 digits, least significant first
  std::vector<uint8_t> digits;
  digits.reserve(data.size() * 138 / 100 + 1);

  for (std::size_t i = zeros; i < data.size(); ++i) {
    int carry = data[i];
    for (auto& digit : digits) {
      carry += digit << 8;
      digit = static_cast<uint8_t>(carry % 58);
      carry /= 58;
    }
    while (carry > 0) {
      digits.push_back(static_cast<uint8_t>(carry % 58));
      carry /= 58;
    }
  }

  std::string result(zeros, '1');
  result.reserve(zeros + digits.size());
  for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
    result += ALPHABET[*it];
  }
  return result;
}

std::optional<std::vector<uint8_t>> from_base58(const std::string& text) {
  std::size_t zeros = 0;
  while (zeros < text.size() && text[zeros] == '1') {
    ++zeros;
  }

  // Decoded bytes, least significant first
  std::vector<uint8_t> bytes;
  bytes.reserve(text.size() * 733 / 1000 + 1);

  for (std::size_t i = zeros; i < text.size(); ++i) {
    int carry = alphabet_index(text[i]);
    if (carry < 0) {
      return std::nullopt;
    }
    for (auto& byte : bytes) {
      carry += byte * 58;
      byte = static_cast<uint8_t>(carry & 0xff);
      carry >>= 8;
    }
    while (carry > 0) {
      bytes.push_back(static_cast<uint8_t>(carry & 0xff));
      carry >>= 8;
    }
  }

  std::vector<uint8_t> result(zeros, 0);
  result.insert(result.end(), bytes.rbegin(), bytes.rend());
  return result;
}

} // namespace crypto
} // namespace castore
