#ifndef CASTORE_CAS_ADDRESSABLE_CONTENT_HPP
#define CASTORE_CAS_ADDRESSABLE_CONTENT_HPP

#include "castore/cas/address.hpp"

namespace castore {
namespace cas {

// Capability of every type a HashTable stores.
//
// A type T implementing it also provides
//   static T from_content(const Content& content);
// which must satisfy T::from_content(x.content()) == x and throw
// DecodeError on bytes it did not produce.
class AddressableContent {
public:
  virtual ~AddressableContent() = default;

  // Canonical byte form of this value
  virtual Content content() const = 0;

  // Digest of content() under DEFAULT_HASH_ALGORITHM
  virtual Address address() const {
    return Address::from_content(content(), DEFAULT_HASH_ALGORITHM);
  }
};

} // namespace cas
} // namespace castore

#endif // CASTORE_CAS_ADDRESSABLE_CONTENT_HPP
