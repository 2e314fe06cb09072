#ifndef CASTORE_ENTRY_ENTRY_META_HPP
#define CASTORE_ENTRY_ENTRY_META_HPP

#include <string>
#include "castore/cas/addressable_content.hpp"

namespace castore {
namespace entry {

// Entity-attribute-value assertion about a stored entry.
//
// E = entry_address, the entry the assertion is about
// A = attribute, the name of the meta attribute
// V = value, the value of the meta attribute
// source = the agent making the assertion
//
// The address covers E and A only, so a later assertion of the same
// attribute on the same entry lands in the same slot and replaces it.
// Ordering is by E, then A, then V. Source takes no part in either.
class EntryMeta : public cas::AddressableContent {
public:
  // ---- CONSTRUCTOR ----
  EntryMeta(std::string source, cas::Address entry_address,
            std::string attribute, std::string value);


  // ---- ACCESSORS ----
  cas::Address entry_address() const { return entry_address_; }
  std::string attribute() const { return attribute_; }
  std::string value() const { return value_; }
  std::string source() const { return source_; }


  // ---- ADDRESSABLE CONTENT ----
  // make_address(entry_address(), attribute(), DEFAULT_HASH_ALGORITHM)
  cas::Address address() const override;
  // {"entry_address":"...","attribute":"...","value":"...","source":"..."}
  cas::Content content() const override;
  // Throws cas::DecodeError on malformed JSON, missing or non-string fields
  static EntryMeta from_content(const cas::Content& content);

  // Digest of entry_address text followed by the attribute name
  static cas::Address make_address(const cas::Address& entry_address,
                                   const std::string& attribute,
                                   cas::HashAlgorithm algorithm);


  // ---- ORDERING ----
  // Negative, zero or positive as this sorts before, with or after other
  int compare(const EntryMeta& other) const;

  friend bool operator<(const EntryMeta& a, const EntryMeta& b) { return a.compare(b) < 0; }
  friend bool operator>(const EntryMeta& a, const EntryMeta& b) { return a.compare(b) > 0; }
  friend bool operator<=(const EntryMeta& a, const EntryMeta& b) { return a.compare(b) <= 0; }
  friend bool operator>=(const EntryMeta& a, const EntryMeta& b) { return a.compare(b) >= 0; }

  // Equality compares all four fields, source included
  friend bool operator==(const EntryMeta& a, const EntryMeta& b) {
    return a.compare(b) == 0 && a.source_ == b.source_;
  }
  friend bool operator!=(const EntryMeta& a, const EntryMeta& b) { return !(a == b); }

private:
  cas::Address entry_address_;
  std::string attribute_;
  std::string value_;
  std::string source_;
};

std::ostream& operator<<(std::ostream& os, const EntryMeta& meta);

} // namespace entry
} // namespace castore

#endif // CASTORE_ENTRY_ENTRY_META_HPP
