#include <gtest/gtest.h>
#include <algorithm>
#include <vector>
#include "castore/cas/cas_error.hpp"
#include "castore/entry/entry_meta.hpp"
#include "test_utils.hpp"

using namespace castore;
using castore::entry::EntryMeta;

class EntryMetaTest : public ::testing::Test {
protected:
  static EntryMeta meta(const std::string& entry, const std::string& attribute,
                        const std::string& value, const std::string& source = test_node_id()) {
    return EntryMeta(source, cas::Address(entry), attribute, value);
  }
};

TEST_F(EntryMetaTest, Accessors) {
  const EntryMeta m = test_meta();
  EXPECT_EQ(m.entry_address(), test_entry().address());
  EXPECT_EQ(m.attribute(), test_attribute());
  EXPECT_EQ(m.value(), test_value());
  EXPECT_EQ(m.source(), test_node_id());
}

TEST_F(EntryMetaTest, AddressCoversEntryAndAttributeOnly) {
  const EntryMeta a = meta("E1", "color", "red", "agentA");
  const EntryMeta b = meta("E1", "color", "blue", "agentB");
  const EntryMeta c = meta("E1", "size", "red", "agentA");
  const EntryMeta d = meta("E2", "color", "red", "agentA");

  EXPECT_EQ(a.address(), b.address());
  EXPECT_NE(a.address(), c.address());
  EXPECT_NE(a.address(), d.address());
  EXPECT_EQ(a.address().str(), "QmZjgXR1Xpy38rP5YPT1C8dxM6ymyJYCaYLYt5SYYiKzC6");
}

TEST_F(EntryMetaTest, MakeAddress) {
  EXPECT_EQ(test_meta().address().str(), "QmXn6Xaeu3hfbEGpgi7pMZAgoBmM7hXAQvi7w5ZgVigFYz");
  EXPECT_EQ(test_meta().address(),
            EntryMeta::make_address(test_entry().address(), test_attribute(), cas::HashAlgorithm::SHA2_256));
  EXPECT_EQ(EntryMeta::make_address(cas::Address("E1"), "color", cas::HashAlgorithm::SHA2_256),
            cas::Address::from_content("E1color", cas::HashAlgorithm::SHA2_256));
  EXPECT_NE(EntryMeta::make_address(cas::Address("E1"), "color", cas::HashAlgorithm::SHA3_256),
            EntryMeta::make_address(cas::Address("E1"), "color", cas::HashAlgorithm::SHA2_256));
}

TEST_F(EntryMetaTest, Ordering) {
  const EntryMeta m_1ax = meta("1", "a", "x");
  const EntryMeta m_1ay = meta("1", "a", "y");
  const EntryMeta m_1bx = meta("1", "b", "x");
  const EntryMeta m_2ax = meta("2", "a", "x");

  // Entry address dominates
  EXPECT_LT(m_1ax.compare(m_2ax), 0);
  EXPECT_EQ(m_1ax.compare(m_1ax), 0);
  EXPECT_GT(m_2ax.compare(m_1ax), 0);
  EXPECT_LT(m_1ay, m_2ax);
  EXPECT_LT(m_1bx, m_2ax);

  // Then attribute
  EXPECT_LT(m_1ax, m_1bx);
  EXPECT_GT(m_1bx, m_1ax);
  EXPECT_LT(m_1ay, m_1bx);

  // Then value
  EXPECT_LT(m_1ax, m_1ay);
  EXPECT_GT(m_1ay, m_1ax);
  EXPECT_LE(m_1ax, m_1ax);
  EXPECT_GE(m_1ay, m_1ax);

  std::vector<EntryMeta> metas = {m_2ax, m_1bx, m_1ay, m_1ax};
  std::sort(metas.begin(), metas.end());
  EXPECT_EQ(metas, (std::vector<EntryMeta>{m_1ax, m_1ay, m_1bx, m_2ax}));
}

TEST_F(EntryMetaTest, SourceIsNotOrderedButIsCompared) {
  const EntryMeta a = meta("1", "a", "x", "agentA");
  const EntryMeta b = meta("1", "a", "x", "agentB");

  EXPECT_EQ(a.compare(b), 0);
  EXPECT_FALSE(a < b);
  EXPECT_FALSE(b < a);
  EXPECT_NE(a, b);
  EXPECT_EQ(a, meta("1", "a", "x", "agentA"));
}

TEST_F(EntryMetaTest, ContentIsCompactJsonInFieldOrder) {
  const std::string expected =
    "{\"entry_address\":\"QmbXSE38SN3SuJDmHKSSw5qWWegvU7oTxrLDRavWjyxMrT\","
    "\"attribute\":\"meta-attribute\",\"value\":\"meta value\",\"source\":\"test node id\"}";

  EXPECT_EQ(test_meta().content(), expected);
  EXPECT_EQ(EntryMeta::from_content(expected), test_meta());
  EXPECT_EQ(EntryMeta::from_content(test_meta_b().content()), test_meta_b());
}

TEST_F(EntryMetaTest, ContentOfInvalidUtf8IsAnEncodeError) {
  const EntryMeta bad_value = meta("E1", "color", "\xff");
  const EntryMeta bad_source = meta("E1", "color", "red", "agent\xc3");

  EXPECT_THROW(bad_value.content(), cas::EncodeError);
  EXPECT_THROW(bad_source.content(), cas::EncodeError);
  // The address never serializes the fields
  EXPECT_EQ(bad_value.address(), meta("E1", "color", "red").address());

  try {
    bad_value.content();
    FAIL() << "Expected EncodeError";
  } catch (const cas::CasError& e) {
    EXPECT_NE(std::string(e.what()).find("Encode error"), std::string::npos);
  }
}

TEST_F(EntryMetaTest, FromContentAcceptsAnyKeyOrder) {
  const std::string reordered =
    "{\"source\":\"s\",\"value\":\"v\",\"attribute\":\"a\",\"entry_address\":\"e\"}";
  EXPECT_EQ(EntryMeta::from_content(reordered), meta("e", "a", "v", "s"));
}

TEST_F(EntryMetaTest, FromContentRejectsMalformedInput) {
  EXPECT_THROW(EntryMeta::from_content(""), cas::DecodeError);
  EXPECT_THROW(EntryMeta::from_content("{\"entry_address\":"), cas::DecodeError);
  EXPECT_THROW(EntryMeta::from_content("\"just a string\""), cas::DecodeError);
  // Missing source
  EXPECT_THROW(EntryMeta::from_content("{\"entry_address\":\"e\",\"attribute\":\"a\",\"value\":\"v\"}"),
               cas::DecodeError);
  // Value is not a string
  EXPECT_THROW(EntryMeta::from_content(
                 "{\"entry_address\":\"e\",\"attribute\":\"a\",\"value\":[],\"source\":\"s\"}"),
               cas::DecodeError);
  // An entry is not a meta
  EXPECT_THROW(EntryMeta::from_content(test_entry().content()), cas::DecodeError);
}

TEST_F(EntryMetaTest, AccessorsReturnCopies) {
  const EntryMeta m = test_meta();
  std::string attribute = m.attribute();
  attribute += "-changed";
  EXPECT_EQ(m.attribute(), test_attribute());
}
