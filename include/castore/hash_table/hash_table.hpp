#ifndef CASTORE_HASH_TABLE_HASH_TABLE_HPP
#define CASTORE_HASH_TABLE_HASH_TABLE_HPP

#include <optional>
#include <vector>
#include "castore/cas/address.hpp"
#include "castore/entry/entry.hpp"
#include "castore/entry/entry_meta.hpp"

namespace castore {
namespace hash_table {

// Storage backend for entries and their metadata, keyed by address.
//
// Absence is std::nullopt. Failures throw cas::CasError subclasses:
// IoError for the underlying storage, DecodeError for stored bytes that
// do not parse. Writers must be serialized by the caller.
class HashTable {
public:
  virtual ~HashTable() = default;

  // ---- ENTRIES ----
  // Stores entry under entry.address(); rewriting the same entry is idempotent
  virtual void put_entry(const entry::Entry& entry) = 0;
  virtual std::optional<entry::Entry> entry(const cas::Address& address) const = 0;


  // ---- METADATA ----
  // Stores meta under meta.address(), replacing any earlier assertion of
  // the same attribute on the same entry
  virtual void assert_meta(const entry::EntryMeta& meta) = 0;
  // Point lookup by the meta's own address
  virtual std::optional<entry::EntryMeta> get_meta(const cas::Address& address) const = 0;
  // All metas whose entry_address is entry.address(), in EntryMeta order
  virtual std::vector<entry::EntryMeta> metas_from_entry(const entry::Entry& entry) const = 0;
};

} // namespace hash_table
} // namespace castore

#endif // CASTORE_HASH_TABLE_HASH_TABLE_HPP
