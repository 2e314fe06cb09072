#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "castore/cas/cas_error.hpp"
#include "castore/crypto/multihash.hpp"

using namespace castore::crypto;

TEST(MultihashTest, DigestSizes) {
  const std::string data = "foo";
  for (auto algorithm : {HashAlgorithm::SHA1, HashAlgorithm::SHA2_256,
                         HashAlgorithm::SHA2_512, HashAlgorithm::SHA3_256}) {
    EXPECT_EQ(digest(algorithm, data).size(), digest_size(algorithm))
      << "Wrong digest size for " << hash_algorithm_to_string(algorithm);
  }
}

TEST(MultihashTest, Sha256KnownAnswer) {
  auto hash = digest(HashAlgorithm::SHA2_256, "abc");
  ASSERT_EQ(hash.size(), 32u);
  // ba7816bf 8f01cfea ... f20015ad
  EXPECT_EQ(hash[0], 0xba);
  EXPECT_EQ(hash[1], 0x78);
  EXPECT_EQ(hash[2], 0x16);
  EXPECT_EQ(hash[3], 0xbf);
  EXPECT_EQ(hash[31], 0xad);
}

TEST(MultihashTest, DigestIsDeterministic) {
  EXPECT_EQ(digest(HashAlgorithm::SHA2_256, "same"), digest(HashAlgorithm::SHA2_256, "same"));
  EXPECT_NE(digest(HashAlgorithm::SHA2_256, "same"), digest(HashAlgorithm::SHA2_256, "different"));
  EXPECT_NE(digest(HashAlgorithm::SHA2_256, "same"), digest(HashAlgorithm::SHA3_256, "same"));
}

TEST(MultihashTest, UnsupportedAlgorithmIsADigestError) {
  const auto unknown = static_cast<HashAlgorithm>(0x99);
  EXPECT_THROW(digest(unknown, "x"), castore::cas::DigestError);
  // Repeated failures leave the supported algorithms usable
  EXPECT_THROW(digest(unknown, "x"), castore::cas::DigestError);
  EXPECT_EQ(digest(HashAlgorithm::SHA2_256, "x").size(), 32u);
}

TEST(MultihashTest, FramingCarriesCodeAndLength) {
  Multihash multihash{HashAlgorithm::SHA2_256, digest(HashAlgorithm::SHA2_256, "foo")};
  auto bytes = encode_multihash(multihash);

  ASSERT_EQ(bytes.size(), 34u);
  EXPECT_EQ(bytes[0], 0x12);
  EXPECT_EQ(bytes[1], 32);

  auto decoded = decode_multihash(bytes);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->algorithm, HashAlgorithm::SHA2_256);
  EXPECT_EQ(decoded->digest, multihash.digest);
}

TEST(MultihashTest, DecodeRejectsMalformedFrames) {
  auto bytes = encode_multihash({HashAlgorithm::SHA2_256, digest(HashAlgorithm::SHA2_256, "foo")});

  // Too short
  EXPECT_FALSE(decode_multihash({}).has_value());
  EXPECT_FALSE(decode_multihash({0x12}).has_value());

  // Unknown code
  auto unknown = bytes;
  unknown[0] = 0x99;
  EXPECT_FALSE(decode_multihash(unknown).has_value());

  // Length byte disagrees with the algorithm
  auto wrong_length = bytes;
  wrong_length[1] = 20;
  EXPECT_FALSE(decode_multihash(wrong_length).has_value());

  // Truncated digest
  auto truncated = bytes;
  truncated.pop_back();
  EXPECT_FALSE(decode_multihash(truncated).has_value());
}

TEST(MultihashTest, CodeLookup) {
  EXPECT_EQ(hash_algorithm_from_code(0x11), HashAlgorithm::SHA1);
  EXPECT_EQ(hash_algorithm_from_code(0x12), HashAlgorithm::SHA2_256);
  EXPECT_EQ(hash_algorithm_from_code(0x13), HashAlgorithm::SHA2_512);
  EXPECT_EQ(hash_algorithm_from_code(0x16), HashAlgorithm::SHA3_256);
  EXPECT_FALSE(hash_algorithm_from_code(0x00).has_value());
  EXPECT_STREQ(hash_algorithm_to_string(DEFAULT_HASH_ALGORITHM), "sha2-256");
}
