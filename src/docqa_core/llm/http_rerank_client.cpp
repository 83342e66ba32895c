#include "docqa_core/llm/http_rerank_client.hpp"

#include <curl/curl.h>

#include <memory>
#include <nlohmann/json.hpp>

namespace docqa_core {

HttpRerankClient::HttpRerankClient(const std::string &rerank_url, long timeout_seconds)
    : rerank_url_(rerank_url), timeout_seconds_(timeout_seconds) {
  if (rerank_url_.empty()) {
    throw RerankError("Rerank service URL is empty");
  }
}

size_t HttpRerankClient::write_callback(void *contents, size_t size, size_t nmemb,
                                        std::string *userp) {
  userp->append(static_cast<char *>(contents), size * nmemb);
  return size * nmemb;
}

std::string HttpRerankClient::post_json(const std::string &payload) {
  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
  if (!curl) {
    throw RerankError("Failed to initialize CURL");
  }
  std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(
      curl_slist_append(nullptr, "Content-Type: application/json"), &curl_slist_free_all);

  std::string response_buffer;
  curl_easy_setopt(curl.get(), CURLOPT_URL, rerank_url_.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, payload.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_buffer);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_seconds_);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

  CURLcode res = curl_easy_perform(curl.get());
  if (res != CURLE_OK) {
    throw RerankError("CURL request failed: " + std::string(curl_easy_strerror(res)));
  }

  long http_code = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);
  if (http_code != 200) {
    throw RerankError("Rerank request failed with status code: " + std::to_string(http_code));
  }
  return response_buffer;
}

std::vector<float> HttpRerankClient::parse_scores(const std::string &body, size_t expected) {
  nlohmann::json parsed;
  try {
    parsed = nlohmann::json::parse(body);
  } catch (const nlohmann::json::parse_error &e) {
    throw RerankError("Rerank response is not valid JSON: " + std::string(e.what()));
  }
  if (!parsed.is_array()) {
    throw RerankError("Rerank response is not an array");
  }

  std::vector<float> scores(expected, 0.0f);
  std::vector<bool> seen(expected, false);
  for (const auto &item : parsed) {
    if (!item.contains("index") || !item.contains("score")) {
      throw RerankError("Rerank result entry is missing index or score");
    }
    const auto index = item["index"].get<size_t>();
    if (index >= expected) {
      throw RerankError("Rerank result index out of range: " + std::to_string(index));
    }
    scores[index] = item["score"].get<float>();
    seen[index] = true;
  }
  for (size_t i = 0; i < expected; ++i) {
    if (!seen[i]) {
      throw RerankError("Rerank response has no score for text " + std::to_string(i));
    }
  }
  return scores;
}

std::vector<float> HttpRerankClient::score_all(const std::string &question,
                                               const std::vector<std::string> &documents) {
  if (documents.empty()) {
    return {};
  }
  nlohmann::json payload = {{"query", question}, {"texts", documents}, {"raw_scores", false}};
  return parse_scores(post_json(payload.dump()), documents.size());
}

float HttpRerankClient::score(const std::string &question, const std::string &document) {
  return score_all(question, {document}).front();
}

}  // namespace docqa_core
