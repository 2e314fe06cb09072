#ifndef CASTORE_TEST_UTILS_HPP
#define CASTORE_TEST_UTILS_HPP

#include <chrono>
#include <filesystem>
#include <random>
#include <string>
#include "castore/entry/entry.hpp"
#include "castore/entry/entry_meta.hpp"
#include "castore/logger/logger.hpp"

// Console logging with warnings and errors visible in test output
inline void init_logging(boost::log::trivial::severity_level level = boost::log::trivial::warning) {
    castore::logging::init_console_logging(level);
}

// Unique, freshly created directory under the system temp directory
inline std::filesystem::path make_test_dir(const std::string& prefix) {
    std::random_device rd;
    std::filesystem::path dir = std::filesystem::temp_directory_path() /
        (prefix + "_" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count()) +
         "_" + std::to_string(rd()));
    std::filesystem::create_directories(dir);
    return dir;
}

// ---- FIXTURES ----
inline std::string test_node_id() { return "test node id"; }

inline castore::entry::Entry test_entry() {
    return castore::entry::Entry("test entry content");
}

inline castore::entry::Entry test_entry_b() {
    return castore::entry::Entry("other test entry content");
}

// Known address of test_entry() under sha2-256
inline constexpr char TEST_ENTRY_ADDRESS[] = "QmbXSE38SN3SuJDmHKSSw5qWWegvU7oTxrLDRavWjyxMrT";

inline std::string test_attribute() { return "meta-attribute"; }
inline std::string test_attribute_b() { return "another-attribute"; }
inline std::string test_value() { return "meta value"; }
inline std::string test_value_b() { return "another value"; }

inline castore::entry::EntryMeta test_meta_for(const castore::entry::Entry& entry,
                                               const std::string& attribute,
                                               const std::string& value) {
    return castore::entry::EntryMeta(test_node_id(), entry.address(), attribute, value);
}

inline castore::entry::EntryMeta test_meta() {
    return test_meta_for(test_entry(), test_attribute(), test_value());
}

// Same entry as test_meta(), different attribute and value
inline castore::entry::EntryMeta test_meta_b() {
    return test_meta_for(test_entry(), test_attribute_b(), test_value_b());
}

#endif // CASTORE_TEST_UTILS_HPP
