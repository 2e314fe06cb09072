#include "castore/entry/entry.hpp"
#include <utility>

namespace castore {
namespace entry {

Entry::Entry(std::string value) : value_(std::move(value)) {}

cas::Content Entry::content() const {
  return value_;
}

Entry Entry::from_content(const cas::Content& content) {
  return Entry(content);
}

} // namespace entry
} // namespace castore
