#include "castore/entry/entry_meta.hpp"
#include "castore/cas/cas_error.hpp"
#include <boost/log/trivial.hpp>
#include <nlohmann/json.hpp>
#include <utility>

namespace castore {
namespace entry {

EntryMeta::EntryMeta(std::string source, cas::Address entry_address,
                     std::string attribute, std::string value)
  : entry_address_(std::move(entry_address))
  , attribute_(std::move(attribute))
  , value_(std::move(value))
  , source_(std::move(source)) {}


//==============================================
// ADDRESSABLE CONTENT
//==============================================

cas::Address EntryMeta::address() const {
  return make_address(entry_address_, attribute_, cas::DEFAULT_HASH_ALGORITHM);
}

cas::Content EntryMeta::content() const {
  nlohmann::ordered_json json;
  json["entry_address"] = entry_address_.str();
  json["attribute"] = attribute_;
  json["value"] = value_;
  json["source"] = source_;
  try {
    return json.dump();
  } catch (const nlohmann::json::exception& e) {
    // Fields must be valid UTF-8 to be written as JSON strings
    BOOST_LOG_TRIVIAL(error) << "EntryMeta: Failed to encode content: " << e.what();
    throw cas::EncodeError(std::string("EntryMeta: ") + e.what());
  }
}

EntryMeta EntryMeta::from_content(const cas::Content& content) {
  try {
    auto json = nlohmann::ordered_json::parse(content);
    if (!json.is_object()) {
      throw cas::DecodeError("EntryMeta content is not a JSON object");
    }
    return EntryMeta(json.at("source").get<std::string>(),
                     cas::Address(json.at("entry_address").get<std::string>()),
                     json.at("attribute").get<std::string>(),
                     json.at("value").get<std::string>());
  } catch (const nlohmann::json::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "EntryMeta: Failed to decode content: " << e.what();
    throw cas::DecodeError(std::string("EntryMeta: ") + e.what());
  }
}

cas::Address EntryMeta::make_address(const cas::Address& entry_address,
                                     const std::string& attribute,
                                     cas::HashAlgorithm algorithm) {
  return cas::Address::from_content(entry_address.str() + attribute, algorithm);
}


//==============================================
// ORDERING
//==============================================

int EntryMeta::compare(const EntryMeta& other) const {
  if (int c = entry_address_.str().compare(other.entry_address_.str()); c != 0) {
    return c;
  }
  if (int c = attribute_.compare(other.attribute_); c != 0) {
    return c;
  }
  return value_.compare(other.value_);
}

std::ostream& operator<<(std::ostream& os, const EntryMeta& meta) {
  return os << "EntryMeta{" << meta.entry_address() << ", " << meta.attribute()
            << ", " << meta.value() << ", " << meta.source() << "}";
}

} // namespace entry
} // namespace castore
