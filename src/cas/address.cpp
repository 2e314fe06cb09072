#include "castore/cas/address.hpp"
#include "castore/crypto/base58.hpp"
#include <boost/log/trivial.hpp>
#include <utility>

namespace castore {
namespace cas {

Address::Address(std::string value) : value_(std::move(value)) {}

Address Address::from_content(const Content& content, HashAlgorithm algorithm) {
  crypto::Multihash multihash{algorithm, crypto::digest(algorithm, content)};
  Address address(crypto::to_base58(crypto::encode_multihash(multihash)));
  BOOST_LOG_TRIVIAL(trace) << "Address: Derived " << address << " from " << content.size()
                           << " bytes using " << crypto::hash_algorithm_to_string(algorithm);
  return address;
}

std::optional<Address> Address::parse(const std::string& text) {
  Address address(text);
  if (!address.is_well_formed()) {
    return std::nullopt;
  }
  return address;
}

bool Address::is_well_formed() const {
  return algorithm().has_value();
}

std::optional<HashAlgorithm> Address::algorithm() const {
  if (value_.empty()) {
    return std::nullopt;
  }

  auto bytes = crypto::from_base58(value_);
  if (!bytes) {
    return std::nullopt;
  }

  auto multihash = crypto::decode_multihash(*bytes);
  if (!multihash) {
    return std::nullopt;
  }
  return multihash->algorithm;
}

std::ostream& operator<<(std::ostream& os, const Address& address) {
  return os << address.str();
}

} // namespace cas
} // namespace castore
