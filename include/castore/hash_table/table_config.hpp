#ifndef CASTORE_HASH_TABLE_TABLE_CONFIG_HPP
#define CASTORE_HASH_TABLE_TABLE_CONFIG_HPP

#include <memory>
#include <string>
#include "castore/hash_table/file_table.hpp"
#include "castore/hash_table/hash_table.hpp"

namespace castore {
namespace hash_table {

enum class TableBackend {
  FILE,
  MEMORY
};

const char* table_backend_to_string(TableBackend backend);

struct TableConfig {
  TableBackend backend{TableBackend::FILE};
  // Root directory, FILE backend only
  std::string root_path;
  CorruptMetaPolicy corrupt_meta_policy{CorruptMetaPolicy::FAIL};
};

// Throws cas::ConstructionError if the config cannot build a table
void validate(const TableConfig& config);

// Builds the backend named by config
std::unique_ptr<HashTable> make_hash_table(const TableConfig& config);

} // namespace hash_table
} // namespace castore

#endif // CASTORE_HASH_TABLE_TABLE_CONFIG_HPP
