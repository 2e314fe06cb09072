#ifndef CASTORE_HASH_TABLE_MEMORY_TABLE_HPP
#define CASTORE_HASH_TABLE_MEMORY_TABLE_HPP

#include <map>
#include <optional>
#include <set>
#include <vector>
#include "castore/hash_table/hash_table.hpp"

namespace castore {
namespace hash_table {

// HashTable held in process memory. Rows keep content bytes, as on disk,
// and an entry -> meta addresses index answers metas_from_entry without
// a scan. Everything is lost with the object.
class MemoryTable : public HashTable {
public:
  MemoryTable();

  void put_entry(const entry::Entry& entry) override;
  std::optional<entry::Entry> entry(const cas::Address& address) const override;
  void assert_meta(const entry::EntryMeta& meta) override;
  std::optional<entry::EntryMeta> get_meta(const cas::Address& address) const override;
  std::vector<entry::EntryMeta> metas_from_entry(const entry::Entry& entry) const override;

  std::size_t entry_count() const { return entries_.size(); }
  std::size_t meta_count() const { return metas_.size(); }

private:
  std::map<cas::Address, cas::Content> entries_;
  std::map<cas::Address, cas::Content> metas_;
  // entry address -> addresses of metas asserted about it
  std::map<cas::Address, std::set<cas::Address>> meta_index_;
};

} // namespace hash_table
} // namespace castore

#endif // CASTORE_HASH_TABLE_MEMORY_TABLE_HPP
