#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace docqa_core {

class HashingError : public std::exception {
 public:
  explicit HashingError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class HashingService {
 public:
  /**
   * @brief Computes the SHA-256 digest of a block of data.
   * @return The digest as a lowercase hex string (64 characters).
   */
  static std::string sha256_hex(std::string_view data);

  /**
   * @brief Hashes several fields as one value.
   *
   * Fields are length-prefixed before hashing so that ("ab", "c") and ("a", "bc")
   * produce different digests.
   */
  static std::string sha256_hex(const std::vector<std::string>& fields);
};

}  // namespace docqa_core
