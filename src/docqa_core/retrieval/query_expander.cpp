#include "docqa_core/retrieval/query_expander.hpp"

#include <algorithm>
#include <iostream>

#include "docqa_core/embedding/embedding_provider.hpp"
#include "docqa_core/services/hashing_service.hpp"

namespace docqa_core {

QueryExpander::QueryExpander(TextGenerationClient& client, std::shared_ptr<BlobStore> cache,
                             size_t expansion_count)
    : client_(client), cache_(std::move(cache)), expansion_count_(expansion_count) {}

std::string QueryExpander::cache_key(const std::string& question) {
  return "expansion:" + HashingService::sha256_hex(question);
}

std::string QueryExpander::build_prompt(const std::string& question) const {
  return "Based on the following user question, write " + std::to_string(expansion_count_) +
         " different ways of asking the same thing. The rephrasings are used to find "
         "relevant passages in a document.\n"
         "Reply with a JSON object of the form {\"questions\": [\"...\"]}.\n\n"
         "Original question: \"" + question + "\"";
}

std::vector<std::string> QueryExpander::strings_from_array(const nlohmann::json& array) {
  std::vector<std::string> out;
  for (const auto& item : array) {
    if (item.is_string() && !is_blank(item.get<std::string>())) {
      out.push_back(item.get<std::string>());
    }
  }
  return out;
}

std::vector<std::string> QueryExpander::parse_paraphrases(const std::string& response) {
  nlohmann::json parsed = nlohmann::json::parse(response, nullptr, false);
  if (parsed.is_discarded()) {
    return {};
  }
  if (parsed.is_array()) {
    return strings_from_array(parsed);
  }
  if (parsed.is_object()) {
    // Models asked for JSON usually wrap the list in an object; take the first string list
    for (const auto& [key, value] : parsed.items()) {
      if (value.is_array()) {
        auto strings = strings_from_array(value);
        if (!strings.empty()) {
          return strings;
        }
      }
    }
  }
  return {};
}

std::vector<std::string> QueryExpander::assemble(const std::string& question,
                                                 const std::vector<std::string>& paraphrases) const {
  std::vector<std::string> result{question};
  for (const auto& paraphrase : paraphrases) {
    if (result.size() > expansion_count_) {
      break;
    }
    if (std::find(result.begin(), result.end(), paraphrase) == result.end()) {
      result.push_back(paraphrase);
    }
  }
  return result;
}

std::vector<std::string> QueryExpander::expand(const std::string& question) {
  if (expansion_count_ == 0 || is_blank(question)) {
    return {question};
  }

  const std::string key = cache_key(question);
  if (cache_) {
    try {
      if (auto cached = cache_->get_text(key)) {
        auto paraphrases = parse_paraphrases(*cached);
        if (!paraphrases.empty()) {
          return assemble(question, paraphrases);
        }
      }
    } catch (const BlobStoreError& e) {
      std::cerr << "[QueryExpander] Cache lookup failed: " << e.what() << std::endl;
    }
  }

  std::vector<std::string> paraphrases;
  try {
    GenerationRequest request;
    request.prompt = build_prompt(question);
    request.json_output = true;
    request.temperature = 0.2f;
    request.max_tokens = 256;
    paraphrases = parse_paraphrases(client_.generate(request));
  } catch (const std::exception& e) {
    std::cerr << "[QueryExpander] Expansion failed, using original question: " << e.what()
              << std::endl;
    return {question};
  }

  if (paraphrases.empty()) {
    std::cerr << "[QueryExpander] Model response had no usable rephrasings" << std::endl;
    return {question};
  }

  if (cache_) {
    try {
      cache_->put_text(key, nlohmann::json(paraphrases).dump());
    } catch (const BlobStoreError& e) {
      std::cerr << "[QueryExpander] Cache store failed: " << e.what() << std::endl;
    }
  }
  return assemble(question, paraphrases);
}

}  // namespace docqa_core
