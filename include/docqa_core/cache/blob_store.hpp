#pragma once

#include <optional>
#include <string>
#include <vector>

namespace docqa_core {

class BlobStoreError : public std::exception {
 public:
  explicit BlobStoreError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @brief Content-addressed key/value storage for opaque blobs.
 *
 * Keys are caller-computed hashes. Implementations must be safe to call from several
 * threads. Values are never interpreted by the store.
 */
class BlobStore {
 public:
  virtual ~BlobStore() = default;

  virtual std::optional<std::vector<char>> get(const std::string& key) = 0;
  virtual void put(const std::string& key, const std::vector<char>& value) = 0;

  std::optional<std::string> get_text(const std::string& key) {
    auto blob = get(key);
    if (!blob) {
      return std::nullopt;
    }
    return std::string(blob->begin(), blob->end());
  }

  void put_text(const std::string& key, const std::string& value) {
    put(key, std::vector<char>(value.begin(), value.end()));
  }
};

}  // namespace docqa_core
