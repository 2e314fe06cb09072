#ifndef CASTORE_ENTRY_ENTRY_HPP
#define CASTORE_ENTRY_ENTRY_HPP

#include <string>
#include "castore/cas/addressable_content.hpp"

namespace castore {
namespace entry {

// Immutable unit of application data, addressed by the digest of its content.
// The content is the value itself, byte for byte.
class Entry : public cas::AddressableContent {
public:
  // ---- CONSTRUCTOR ----
  explicit Entry(std::string value);


  // ---- ACCESSORS ----
  std::string value() const { return value_; }


  // ---- ADDRESSABLE CONTENT ----
  cas::Content content() const override;
  // Any byte string is a valid entry
  static Entry from_content(const cas::Content& content);


  friend bool operator==(const Entry& a, const Entry& b) { return a.value_ == b.value_; }
  friend bool operator!=(const Entry& a, const Entry& b) { return !(a == b); }

private:
  std::string value_;
};

} // namespace entry
} // namespace castore

#endif // CASTORE_ENTRY_ENTRY_HPP
