#pragma once

#include <memory>
#include <string>

namespace docqa_core {

class DocumentFetchError : public std::exception {
 public:
  explicit DocumentFetchError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct FetchedDocument {
  std::string source_url;
  std::string content_type;
  std::string body;
};

class DocumentFetcher {
 public:
  virtual ~DocumentFetcher() = default;
  virtual FetchedDocument fetch(const std::string& url) = 0;
};

// Downloads documents over HTTP(S) with libcurl
class CurlDocumentFetcher : public DocumentFetcher {
 public:
  static constexpr long DEFAULT_TIMEOUT_SECONDS = 20;
  // Documents above this size are refused
  static constexpr size_t MAX_DOCUMENT_BYTES = 64 * 1024 * 1024;

  explicit CurlDocumentFetcher(long timeout_seconds = DEFAULT_TIMEOUT_SECONDS);

  FetchedDocument fetch(const std::string& url) override;

  // Google Drive ".../file/d/<id>/view" links become direct download links
  static std::string resolve_download_url(const std::string& url);

 private:
  long timeout_seconds_;

  static size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp);
};

}  // namespace docqa_core
