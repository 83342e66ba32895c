#include "docqa_core/ingest/document_fetcher.hpp"

#include <curl/curl.h>

#include <iostream>
#include <memory>
#include <regex>

namespace docqa_core {

CurlDocumentFetcher::CurlDocumentFetcher(long timeout_seconds) : timeout_seconds_(timeout_seconds) {}

size_t CurlDocumentFetcher::write_callback(void* contents, size_t size, size_t nmemb,
                                           std::string* userp) {
  const size_t bytes = size * nmemb;
  if (userp->size() + bytes > MAX_DOCUMENT_BYTES) {
    // Returning a short count aborts the transfer
    return 0;
  }
  userp->append(static_cast<char*>(contents), bytes);
  return bytes;
}

std::string CurlDocumentFetcher::resolve_download_url(const std::string& url) {
  static const std::regex drive_view(R"(https?://drive\.google\.com/file/d/([^/?#]+)/view.*)");
  std::smatch match;
  if (std::regex_match(url, match, drive_view)) {
    return "https://drive.google.com/uc?export=download&id=" + match[1].str();
  }
  return url;
}

FetchedDocument CurlDocumentFetcher::fetch(const std::string& url) {
  if (url.empty()) {
    throw DocumentFetchError("Document URL is empty");
  }
  const std::string download_url = resolve_download_url(url);

  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
  if (!curl) {
    throw DocumentFetchError("Failed to initialize CURL");
  }

  std::string response_buffer;
  curl_easy_setopt(curl.get(), CURLOPT_URL, download_url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 5L);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_seconds_);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_buffer);

  std::cout << "[DocumentFetcher] Downloading " << download_url << std::endl;
  CURLcode res = curl_easy_perform(curl.get());
  if (res != CURLE_OK) {
    throw DocumentFetchError("Download of " + url + " failed: " + curl_easy_strerror(res));
  }

  long http_code = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);
  if (http_code < 200 || http_code >= 300) {
    throw DocumentFetchError("Download of " + url + " failed with status code: " +
                             std::to_string(http_code));
  }

  char* content_type = nullptr;
  curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_TYPE, &content_type);

  FetchedDocument document;
  document.source_url = url;
  document.content_type = content_type ? content_type : "";
  document.body = std::move(response_buffer);
  std::cout << "[DocumentFetcher] Received " << document.body.size() << " bytes ("
            << (document.content_type.empty() ? "unknown type" : document.content_type) << ")"
            << std::endl;
  return document;
}

}  // namespace docqa_core
