#ifndef CASTORE_HASH_TABLE_FILE_TABLE_HPP
#define CASTORE_HASH_TABLE_FILE_TABLE_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "castore/hash_table/hash_table.hpp"

namespace castore {
namespace hash_table {

// Logical tables, one subdirectory each under the table root
enum class Table {
  ENTRIES,
  METAS
};

const char* table_to_string(Table table);

// What a metadata scan does with a file it cannot decode
enum class CorruptMetaPolicy {
  FAIL,  // throw cas::DecodeError, the query fails
  SKIP   // log a warning and leave the file out of the result
};

const char* corrupt_meta_policy_to_string(CorruptMetaPolicy policy);

// HashTable over a directory tree:
//   <root>/entries/<address>.json
//   <root>/metas/<address>.json
// Each file holds the raw content() bytes of one item.
class FileTable : public HashTable {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Throws cas::ConstructionError unless path canonicalizes to an existing directory
  explicit FileTable(const std::string& path,
                     CorruptMetaPolicy policy = CorruptMetaPolicy::FAIL);


  // ---- HASH TABLE ----
  void put_entry(const entry::Entry& entry) override;
  std::optional<entry::Entry> entry(const cas::Address& address) const override;
  void assert_meta(const entry::EntryMeta& meta) override;
  std::optional<entry::EntryMeta> get_meta(const cas::Address& address) const override;
  // Full scan of the metas directory
  std::vector<entry::EntryMeta> metas_from_entry(const entry::Entry& entry) const override;


  // ---- PATH RESOLUTION ----
  // Canonical root, fixed at construction
  const std::filesystem::path& path() const { return path_; }
  CorruptMetaPolicy corrupt_meta_policy() const { return policy_; }
  // Ensures the table's subdirectory exists and returns it
  std::filesystem::path dir(Table table) const;
  // <dir(table)>/<address>.json
  std::filesystem::path row_path(Table table, const cas::Address& address) const;

private:
  // ---- PARAMETERS ----
  std::filesystem::path path_;
  CorruptMetaPolicy policy_;


  // ---- FILE OPERATIONS ----
  // Replaces the row for item with its content in one rename
  template <typename AC>
  void upsert(Table table, const AC& item) {
    write_row(row_path(table, item.address()), item.content());
  }

  // Raw content of the row, std::nullopt if there is no such file
  std::optional<cas::Content> lookup(Table table, const cas::Address& address) const;

  void write_row(const std::filesystem::path& file_path, const cas::Content& content) const;
  cas::Content read_row(const std::filesystem::path& file_path) const;


  // ---- METADATA SCAN ----
  // Loads the meta stored in file_path if it belongs to entry_address.
  // Corrupt files are handled according to policy_.
  std::optional<entry::EntryMeta> scan_meta_file(const std::filesystem::path& file_path,
                                                 const cas::Address& entry_address) const;
};

} // namespace hash_table
} // namespace castore

#endif // CASTORE_HASH_TABLE_FILE_TABLE_HPP
