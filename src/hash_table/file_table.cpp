#include "castore/hash_table/file_table.hpp"
#include "castore/cas/cas_error.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>
#include <fstream>
#include <iterator>
#include <system_error>

namespace castore {
namespace hash_table {

const char* table_to_string(Table table) {
  switch (table) {
    case Table::ENTRIES: return "entries";
    case Table::METAS: return "metas";
    default: return "unknown";
  }
}

const char* corrupt_meta_policy_to_string(CorruptMetaPolicy policy) {
  switch (policy) {
    case CorruptMetaPolicy::FAIL: return "fail";
    case CorruptMetaPolicy::SKIP: return "skip";
    default: return "unknown";
  }
}

namespace {

// Addresses become file names, so they must not name a path of their own
bool is_plain_file_name(const cas::Address& address) {
  const std::string& s = address.str();
  return !s.empty() && s != "." && s != ".." &&
         s.find('/') == std::string::npos && s.find('\\') == std::string::npos;
}

} // namespace


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

FileTable::FileTable(const std::string& path, CorruptMetaPolicy policy) : policy_(policy) {
  BOOST_LOG_TRIVIAL(info) << "FileTable: Initializing FileTable with root path: " << path;

  std::error_code ec;
  path_ = std::filesystem::canonical(path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "FileTable: Could not resolve root path " << path << ": " << ec.message();
    throw cas::ConstructionError("could not resolve " + path + ": " + ec.message());
  }

  if (!std::filesystem::is_directory(path_, ec)) {
    BOOST_LOG_TRIVIAL(error) << "FileTable: Root path is not an accessible directory: " << path_.string();
    throw cas::ConstructionError("path is not a directory or permissions don't allow access: " + path_.string());
  }

  BOOST_LOG_TRIVIAL(debug) << "FileTable: Root resolved to " << path_.string()
                           << " (corrupt meta policy: " << corrupt_meta_policy_to_string(policy_) << ")";
}


//==============================================
// HASH TABLE
//==============================================

void FileTable::put_entry(const entry::Entry& entry) {
  BOOST_LOG_TRIVIAL(info) << "FileTable: Putting entry of " << entry.value().size() << " bytes";
  upsert(Table::ENTRIES, entry);
}

std::optional<entry::Entry> FileTable::entry(const cas::Address& address) const {
  auto content = lookup(Table::ENTRIES, address);
  if (!content) {
    return std::nullopt;
  }

  // A row named by a multihash must digest back to that name
  if (auto algorithm = address.algorithm()) {
    if (cas::Address::from_content(*content, *algorithm) != address) {
      BOOST_LOG_TRIVIAL(error) << "FileTable: Entry row does not match its address: " << address;
      throw cas::DecodeError("entry row does not match its address: " + address.str());
    }
  }
  return entry::Entry::from_content(*content);
}

void FileTable::assert_meta(const entry::EntryMeta& meta) {
  BOOST_LOG_TRIVIAL(info) << "FileTable: Asserting meta " << meta.attribute()
                          << " on entry: " << meta.entry_address();
  upsert(Table::METAS, meta);
}

std::optional<entry::EntryMeta> FileTable::get_meta(const cas::Address& address) const {
  auto content = lookup(Table::METAS, address);
  if (!content) {
    return std::nullopt;
  }
  return entry::EntryMeta::from_content(*content);
}

std::vector<entry::EntryMeta> FileTable::metas_from_entry(const entry::Entry& entry) const {
  const cas::Address entry_address = entry.address();
  const std::filesystem::path metas_dir = dir(Table::METAS);
  BOOST_LOG_TRIVIAL(debug) << "FileTable: Scanning " << metas_dir.string() << " for entry: " << entry_address;

  // There is no index from entry to metas, every stored meta is read.
  // Big metadata sets should live in an indexed backend.
  std::vector<entry::EntryMeta> metas;
  std::size_t scanned = 0;
  std::error_code ec;
  std::filesystem::recursive_directory_iterator it(metas_dir, ec);
  const std::filesystem::recursive_directory_iterator end;

  for (; !ec && it != end; it.increment(ec)) {
    std::error_code status_ec;
    const bool regular = it->is_regular_file(status_ec);
    if (status_ec) {
      BOOST_LOG_TRIVIAL(error) << "FileTable: Failed to stat " << it->path().string() << ": " << status_ec.message();
      throw cas::IoError("failed to stat " + it->path().string() + ": " + status_ec.message());
    }

    // Only <address>.json files are rows; leftover temp files are not
    if (!regular || it->path().extension() != ".json") {
      continue;
    }

    ++scanned;
    if (auto meta = scan_meta_file(it->path(), entry_address)) {
      metas.push_back(*meta);
    }
  }

  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "FileTable: Failed to scan " << metas_dir.string() << ": " << ec.message();
    throw cas::IoError("failed to scan " + metas_dir.string() + ": " + ec.message());
  }

  std::sort(metas.begin(), metas.end());
  BOOST_LOG_TRIVIAL(debug) << "FileTable: Found " << metas.size() << " of " << scanned
                           << " metas for entry: " << entry_address;
  return metas;
}


//==============================================
// PATH RESOLUTION
//==============================================

std::filesystem::path FileTable::dir(Table table) const {
  std::filesystem::path dir_path = path_ / table_to_string(table);

  std::error_code ec;
  std::filesystem::create_directories(dir_path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "FileTable: Failed to create directory " << dir_path.string() << ": " << ec.message();
    throw cas::IoError("failed to create directory " + dir_path.string() + ": " + ec.message());
  }
  return dir_path;
}

std::filesystem::path FileTable::row_path(Table table, const cas::Address& address) const {
  if (!is_plain_file_name(address)) {
    throw cas::IoError("address cannot be used as a file name: " + address.str());
  }
  std::filesystem::path file_path = dir(table) / (address.str() + ".json");
  BOOST_LOG_TRIVIAL(trace) << "FileTable: Calculated path: " << file_path.string();
  return file_path;
}


//==============================================
// FILE OPERATIONS
//==============================================

std::optional<cas::Content> FileTable::lookup(Table table, const cas::Address& address) const {
  if (!is_plain_file_name(address)) {
    BOOST_LOG_TRIVIAL(debug) << "FileTable: No row can exist for address: " << address;
    return std::nullopt;
  }

  std::filesystem::path file_path = row_path(table, address);

  std::error_code ec;
  auto status = std::filesystem::status(file_path, ec);
  if (status.type() == std::filesystem::file_type::not_found) {
    BOOST_LOG_TRIVIAL(debug) << "FileTable: No " << table_to_string(table) << " row for address: " << address;
    return std::nullopt;
  }
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "FileTable: Failed to stat " << file_path.string() << ": " << ec.message();
    throw cas::IoError("failed to stat " + file_path.string() + ": " + ec.message());
  }
  if (!std::filesystem::is_regular_file(status)) {
    BOOST_LOG_TRIVIAL(warning) << "FileTable: Row path is not a regular file: " << file_path.string();
    return std::nullopt;
  }

  return read_row(file_path);
}

void FileTable::write_row(const std::filesystem::path& file_path, const cas::Content& content) const {
  std::filesystem::path tmp_path = file_path;
  tmp_path += ".tmp";

  std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "FileTable: Failed to create file: " << tmp_path.string();
    throw cas::IoError("failed to create file: " + tmp_path.string());
  }

  file.write(content.data(), static_cast<std::streamsize>(content.size()));
  file.close();

  std::error_code ec;
  if (!file) {
    std::filesystem::remove(tmp_path, ec);
    BOOST_LOG_TRIVIAL(error) << "FileTable: Failed to write file: " << tmp_path.string();
    throw cas::IoError("failed to write file: " + tmp_path.string());
  }

  // Readers see either the previous row or the new one, never a partial write
  std::filesystem::rename(tmp_path, file_path, ec);
  if (ec) {
    const std::string message = ec.message();
    std::filesystem::remove(tmp_path, ec);
    BOOST_LOG_TRIVIAL(error) << "FileTable: Failed to replace " << file_path.string() << ": " << message;
    throw cas::IoError("failed to replace " + file_path.string() + ": " + message);
  }

  BOOST_LOG_TRIVIAL(info) << "FileTable: Stored " << content.size() << " bytes at: " << file_path.string();
}

cas::Content FileTable::read_row(const std::filesystem::path& file_path) const {
  std::ifstream file(file_path, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "FileTable: Failed to open file: " << file_path.string();
    throw cas::IoError("failed to open file: " + file_path.string());
  }

  cas::Content content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  if (file.bad()) {
    BOOST_LOG_TRIVIAL(error) << "FileTable: Failed to read file: " << file_path.string();
    throw cas::IoError("failed to read file: " + file_path.string());
  }

  BOOST_LOG_TRIVIAL(debug) << "FileTable: Read " << content.size() << " bytes from: " << file_path.string();
  return content;
}


//==============================================
// METADATA SCAN
//==============================================

std::optional<entry::EntryMeta> FileTable::scan_meta_file(const std::filesystem::path& file_path,
                                                          const cas::Address& entry_address) const {
  const std::string stem = file_path.stem().string();

  try {
    if (!cas::Address::parse(stem)) {
      throw cas::DecodeError("file name is not a well-formed address: " + file_path.string());
    }

    auto meta = entry::EntryMeta::from_content(read_row(file_path));
    if (meta.entry_address() != entry_address) {
      return std::nullopt;
    }
    return meta;
  } catch (const cas::DecodeError& e) {
    if (policy_ == CorruptMetaPolicy::SKIP) {
      BOOST_LOG_TRIVIAL(warning) << "FileTable: Skipping corrupt meta " << file_path.string() << ": " << e.what();
      return std::nullopt;
    }
    BOOST_LOG_TRIVIAL(error) << "FileTable: Corrupt meta " << file_path.string() << " failed the scan";
    throw;
  }
}

} // namespace hash_table
} // namespace castore
