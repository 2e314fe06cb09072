#ifndef CASTORE_CAS_ADDRESS_HPP
#define CASTORE_CAS_ADDRESS_HPP

#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include "castore/crypto/multihash.hpp"

namespace castore {
namespace cas {

// Canonical serialized form of a stored value
using Content = std::string;

using crypto::HashAlgorithm;
using crypto::DEFAULT_HASH_ALGORITHM;

// Content-derived storage key: base58 text of a multihash. Comparison is
// lexicographic over the text. Any string can be wrapped; only derived
// (or parsed) addresses are well-formed.
class Address {
public:
  // ---- CONSTRUCTORS ----
  Address() = default;
  explicit Address(std::string value);


  // ---- DERIVATION ----
  // Digests content with the given algorithm and renders the multihash
  static Address from_content(const Content& content, HashAlgorithm algorithm);
  // Accepts only text that decodes to a supported multihash
  static std::optional<Address> parse(const std::string& text);


  // ---- QUERY OPERATIONS ----
  const std::string& str() const { return value_; }
  bool empty() const { return value_.empty(); }
  bool is_well_formed() const;
  // Algorithm named by the multihash code, std::nullopt if not well-formed
  std::optional<HashAlgorithm> algorithm() const;


  // ---- COMPARISON ----
  friend bool operator==(const Address& a, const Address& b) { return a.value_ == b.value_; }
  friend bool operator!=(const Address& a, const Address& b) { return a.value_ != b.value_; }
  friend bool operator<(const Address& a, const Address& b) { return a.value_ < b.value_; }
  friend bool operator>(const Address& a, const Address& b) { return a.value_ > b.value_; }
  friend bool operator<=(const Address& a, const Address& b) { return a.value_ <= b.value_; }
  friend bool operator>=(const Address& a, const Address& b) { return a.value_ >= b.value_; }

private:
  std::string value_;
};

std::ostream& operator<<(std::ostream& os, const Address& address);

} // namespace cas
} // namespace castore

namespace std {

template <>
struct hash<castore::cas::Address> {
  std::size_t operator()(const castore::cas::Address& address) const {
    return std::hash<std::string>()(address.str());
  }
};

} // namespace std

#endif // CASTORE_CAS_ADDRESS_HPP
