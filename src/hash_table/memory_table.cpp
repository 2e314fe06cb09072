#include "castore/hash_table/memory_table.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace castore {
namespace hash_table {

MemoryTable::MemoryTable() {
  BOOST_LOG_TRIVIAL(info) << "MemoryTable: Initializing empty MemoryTable";
}

void MemoryTable::put_entry(const entry::Entry& entry) {
  const cas::Address address = entry.address();
  entries_[address] = entry.content();
  BOOST_LOG_TRIVIAL(info) << "MemoryTable: Stored entry at: " << address;
}

std::optional<entry::Entry> MemoryTable::entry(const cas::Address& address) const {
  auto it = entries_.find(address);
  if (it == entries_.end()) {
    BOOST_LOG_TRIVIAL(debug) << "MemoryTable: No entry for address: " << address;
    return std::nullopt;
  }
  return entry::Entry::from_content(it->second);
}

void MemoryTable::assert_meta(const entry::EntryMeta& meta) {
  const cas::Address address = meta.address();
  const cas::Address entry_address = meta.entry_address();
  // Encoded before anything changes, so a failed assert leaves the table as it was
  const cas::Content content = meta.content();

  // A slot is keyed by entry and attribute, so an overwrite can only move
  // between entries on a digest collision. Keep the index exact anyway.
  auto existing = metas_.find(address);
  if (existing != metas_.end()) {
    const cas::Address previous = entry::EntryMeta::from_content(existing->second).entry_address();
    if (previous != entry_address) {
      auto indexed = meta_index_.find(previous);
      if (indexed != meta_index_.end()) {
        indexed->second.erase(address);
        if (indexed->second.empty()) {
          meta_index_.erase(indexed);
        }
      }
    }
  }

  metas_[address] = content;
  meta_index_[entry_address].insert(address);
  BOOST_LOG_TRIVIAL(info) << "MemoryTable: Asserted meta " << meta.attribute()
                          << " on entry: " << entry_address;
}

std::optional<entry::EntryMeta> MemoryTable::get_meta(const cas::Address& address) const {
  auto it = metas_.find(address);
  if (it == metas_.end()) {
    BOOST_LOG_TRIVIAL(debug) << "MemoryTable: No meta for address: " << address;
    return std::nullopt;
  }
  return entry::EntryMeta::from_content(it->second);
}

std::vector<entry::EntryMeta> MemoryTable::metas_from_entry(const entry::Entry& entry) const {
  std::vector<entry::EntryMeta> metas;

  auto indexed = meta_index_.find(entry.address());
  if (indexed == meta_index_.end()) {
    return metas;
  }

  metas.reserve(indexed->second.size());
  for (const auto& address : indexed->second) {
    if (auto meta = get_meta(address)) {
      metas.push_back(*meta);
    }
  }

  std::sort(metas.begin(), metas.end());
  return metas;
}

} // namespace hash_table
} // namespace castore
