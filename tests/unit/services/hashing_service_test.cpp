#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "docqa_core/services/hashing_service.hpp"

namespace docqa_core {

TEST(HashingServiceTest, KnownDigestOfEmptyInput) {
  EXPECT_EQ(HashingService::sha256_hex(std::string_view("")),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(HashingServiceTest, KnownDigestOfAbc) {
  EXPECT_EQ(HashingService::sha256_hex(std::string_view("abc")),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(HashingServiceTest, DigestIsLowercaseHexOfFixedLength) {
  const std::string digest = HashingService::sha256_hex(std::string_view("document text"));
  ASSERT_EQ(digest.size(), 64u);
  for (char c : digest) {
    EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')) << "unexpected char " << c;
  }
}

TEST(HashingServiceTest, FieldBoundariesChangeTheDigest) {
  const auto split_late = HashingService::sha256_hex(std::vector<std::string>{"ab", "c"});
  const auto split_early = HashingService::sha256_hex(std::vector<std::string>{"a", "bc"});
  EXPECT_NE(split_late, split_early);
}

TEST(HashingServiceTest, FieldListIsDeterministic) {
  std::vector<std::string> fields = {"rag", "fingerprint", "What is covered?"};
  EXPECT_EQ(HashingService::sha256_hex(fields), HashingService::sha256_hex(fields));
}

TEST(HashingServiceTest, EmptyFieldIsNotIgnored) {
  const auto with_empty = HashingService::sha256_hex(std::vector<std::string>{"a", ""});
  const auto without = HashingService::sha256_hex(std::vector<std::string>{"a"});
  EXPECT_NE(with_empty, without);
}

}  // namespace docqa_core
