#pragma once

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace docqa_api {

class Config {
 public:
  // Retries beyond this add only delay; also keeps the backoff exponent small
  static constexpr int MAX_GENERATION_ATTEMPTS = 10;

  std::string api_base_url;
  std::string bearer_token;
  int server_threads;
  int server_timeout_seconds;

  // Model servers
  std::string ollama_url;
  std::string embedding_model;
  int embedding_dimension;
  int embedding_batch_size;
  std::string expansion_model;
  std::string generation_model;
  int expansion_count;
  std::string reranker_url;

  // Segmentation
  std::string segmentation_strategy;
  int chunk_size;
  int chunk_overlap;
  double semantic_percentile;

  // Retrieval limits
  int retrieval_top_k;
  int retrieval_query_limit;
  int candidate_limit;
  int rerank_top_k;

  // Budgets and retries
  int ingestion_timeout_ms;
  int request_deadline_ms;
  int generation_max_attempts;
  int generation_initial_backoff_ms;
  int generation_max_backoff_ms;
  int num_workers;

  // Caches
  std::string cache_db_path;
  std::string cache_db_key;
  int cache_max_entries;
  int cache_ttl_hours;
  int memory_cache_entries;
  // Built indices held in memory; each one carries every embedding of a document
  int index_cache_entries;

  std::string interaction_log_path;
  int short_document_block_limit;
  nlohmann::json override_rules;

  // DOCQA_CONFIG if set, otherwise docqarc.json in the working directory
  static std::string default_path() {
    const char* env_path = std::getenv("DOCQA_CONFIG");
    return (env_path && *env_path) ? std::string(env_path) : std::string("docqarc.json");
  }

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename +
                               "': " + e.what());
    }

    Config config = from_json(json_config);
    config.apply_environment();
    return config;
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    if (!json_config.is_object()) {
      throw std::runtime_error("Configuration must be a JSON object");
    }

    Config config;
    try {
      config.api_base_url = json_config.value("api_base_url", std::string("127.0.0.1:8000"));
      config.bearer_token = json_config.value("bearer_token", std::string());
      config.server_threads = json_config.value("server_threads", 0);
      config.server_timeout_seconds = json_config.value("server_timeout_seconds", 60);

      config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
      config.embedding_model = json_config.value("embedding_model", std::string("nomic-embed-text"));
      config.embedding_dimension = json_config.value("embedding_dimension", 768);
      config.embedding_batch_size = json_config.value("embedding_batch_size", 100);
      config.expansion_model = json_config.value("expansion_model", std::string("llama3.1"));
      config.generation_model = json_config.value("generation_model", std::string("llama3.1"));
      config.expansion_count = json_config.value("expansion_count", 3);
      config.reranker_url =
          json_config.value("reranker_url", std::string("http://localhost:8080/rerank"));

      config.segmentation_strategy = json_config.value("segmentation_strategy", std::string("fixed"));
      config.chunk_size = json_config.value("chunk_size", 2000);
      config.chunk_overlap = json_config.value("chunk_overlap", 200);
      config.semantic_percentile = json_config.value("semantic_percentile", 95.0);

      config.retrieval_top_k = json_config.value("retrieval_top_k", 7);
      config.retrieval_query_limit = json_config.value("retrieval_query_limit", 3);
      config.candidate_limit = json_config.value("candidate_limit", 10);
      config.rerank_top_k = json_config.value("rerank_top_k", 7);

      config.ingestion_timeout_ms = json_config.value("ingestion_timeout_ms", 17000);
      config.request_deadline_ms = json_config.value("request_deadline_ms", 35000);
      config.generation_max_attempts = json_config.value("generation_max_attempts", 5);
      config.generation_initial_backoff_ms = json_config.value("generation_initial_backoff_ms", 1000);
      config.generation_max_backoff_ms = json_config.value("generation_max_backoff_ms", 30000);
      config.num_workers = json_config.value("num_workers", 8);

      config.cache_db_path = json_config.value("cache_db_path", std::string("./data/cache.db"));
      config.cache_db_key = json_config.value("cache_db_key", std::string());
      config.cache_max_entries = json_config.value("cache_max_entries", 10000);
      config.cache_ttl_hours = json_config.value("cache_ttl_hours", 720);
      config.memory_cache_entries = json_config.value("memory_cache_entries", 1000);
      config.index_cache_entries = json_config.value("index_cache_entries", 16);

      config.interaction_log_path =
          json_config.value("interaction_log_path", std::string("./logs/interactions.jsonl"));
      config.short_document_block_limit = json_config.value("short_document_block_limit", 0);
      config.override_rules = json_config.value("override_rules", nlohmann::json::array());
    } catch (const nlohmann::json::type_error& e) {
      throw std::runtime_error(std::string("Invalid configuration value: ") + e.what());
    }

    config.validate();
    return config;
  }

  // Secrets may come from the environment instead of the file
  void apply_environment() {
    if (const char* token = std::getenv("DOCQA_BEARER_TOKEN")) {
      bearer_token = token;
    }
    if (const char* key = std::getenv("DOCQA_CACHE_KEY")) {
      cache_db_key = key;
    }
  }

  std::string host() const {
    return api_base_url.substr(0, api_base_url.find(':'));
  }

  int port() const {
    return std::stoi(api_base_url.substr(api_base_url.find(':') + 1));
  }

 private:
  void validate() const {
    if (api_base_url.empty() || api_base_url.find(':') == std::string::npos) {
      throw std::runtime_error("api_base_url must be host:port");
    }
    int parsed_port = 0;
    try {
      parsed_port = port();
    } catch (const std::logic_error&) {
      throw std::runtime_error("api_base_url port is not a number");
    }
    if (parsed_port <= 0 || parsed_port > 65535) {
      throw std::runtime_error("api_base_url port must be within [1, 65535]");
    }
    if (server_threads < 0) {
      throw std::runtime_error("server_threads cannot be negative");
    }
    if (server_timeout_seconds <= 0 || server_timeout_seconds > 255) {
      throw std::runtime_error("server_timeout_seconds must be within [1, 255]");
    }
    if (server_timeout_seconds * 1000 <= request_deadline_ms) {
      throw std::runtime_error("server_timeout_seconds must exceed request_deadline_ms");
    }
    if (ollama_url.empty()) {
      throw std::runtime_error("ollama_url cannot be empty");
    }
    if (embedding_model.empty() || expansion_model.empty() || generation_model.empty()) {
      throw std::runtime_error("model names cannot be empty");
    }
    if (embedding_dimension <= 0) {
      throw std::runtime_error("embedding_dimension must be greater than 0");
    }
    if (embedding_batch_size <= 0) {
      throw std::runtime_error("embedding_batch_size must be greater than 0");
    }
    if (expansion_count < 0) {
      throw std::runtime_error("expansion_count cannot be negative");
    }
    if (segmentation_strategy != "fixed" && segmentation_strategy != "semantic") {
      throw std::runtime_error("segmentation_strategy must be 'fixed' or 'semantic'");
    }
    if (chunk_size <= 0) {
      throw std::runtime_error("chunk_size must be greater than 0");
    }
    if (chunk_overlap < 0 || chunk_overlap >= chunk_size) {
      throw std::runtime_error("chunk_overlap must be in [0, chunk_size)");
    }
    if (semantic_percentile < 0.0 || semantic_percentile > 100.0) {
      throw std::runtime_error("semantic_percentile must be within [0, 100]");
    }
    if (retrieval_top_k <= 0 || retrieval_query_limit <= 0 || candidate_limit <= 0 ||
        rerank_top_k <= 0) {
      throw std::runtime_error("retrieval limits must be greater than 0");
    }
    if (ingestion_timeout_ms <= 0 || request_deadline_ms <= 0) {
      throw std::runtime_error("timeouts must be greater than 0");
    }
    if (ingestion_timeout_ms > request_deadline_ms) {
      throw std::runtime_error("ingestion_timeout_ms cannot exceed request_deadline_ms");
    }
    if (generation_max_attempts <= 0 || generation_max_attempts > MAX_GENERATION_ATTEMPTS) {
      throw std::runtime_error("generation_max_attempts must be within [1, " +
                               std::to_string(MAX_GENERATION_ATTEMPTS) + "]");
    }
    if (generation_initial_backoff_ms < 0) {
      throw std::runtime_error("generation_initial_backoff_ms cannot be negative");
    }
    if (generation_max_backoff_ms < generation_initial_backoff_ms) {
      throw std::runtime_error(
          "generation_max_backoff_ms cannot be below generation_initial_backoff_ms");
    }
    if (num_workers <= 0) {
      throw std::runtime_error("num_workers must be greater than 0");
    }
    if (cache_db_path.empty()) {
      throw std::runtime_error("cache_db_path cannot be empty");
    }
    if (cache_max_entries <= 0 || memory_cache_entries <= 0 || index_cache_entries <= 0) {
      throw std::runtime_error("cache sizes must be greater than 0");
    }
    if (cache_ttl_hours < 0) {
      throw std::runtime_error("cache_ttl_hours cannot be negative");
    }
    if (short_document_block_limit < 0) {
      throw std::runtime_error("short_document_block_limit cannot be negative");
    }
    if (!override_rules.is_array()) {
      throw std::runtime_error("override_rules must be an array");
    }
  }
};

}  // namespace docqa_api
