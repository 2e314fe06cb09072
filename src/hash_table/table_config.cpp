#include "castore/hash_table/table_config.hpp"
#include "castore/cas/cas_error.hpp"
#include "castore/hash_table/memory_table.hpp"
#include <boost/log/trivial.hpp>

namespace castore {
namespace hash_table {

const char* table_backend_to_string(TableBackend backend) {
  switch (backend) {
    case TableBackend::FILE: return "file";
    case TableBackend::MEMORY: return "memory";
    default: return "unknown";
  }
}

void validate(const TableConfig& config) {
  switch (config.backend) {
    case TableBackend::FILE:
      if (config.root_path.empty()) {
        BOOST_LOG_TRIVIAL(error) << "TableConfig: File backend requires a root path";
        throw cas::ConstructionError("file backend requires a root path");
      }
      return;
    case TableBackend::MEMORY:
      return;
  }
  throw cas::ConstructionError("unknown table backend");
}

std::unique_ptr<HashTable> make_hash_table(const TableConfig& config) {
  validate(config);
  BOOST_LOG_TRIVIAL(info) << "TableConfig: Creating " << table_backend_to_string(config.backend)
                          << " hash table";

  if (config.backend == TableBackend::MEMORY) {
    return std::make_unique<MemoryTable>();
  }
  return std::make_unique<FileTable>(config.root_path, config.corrupt_meta_policy);
}

} // namespace hash_table
} // namespace castore
