#include "docqa_core/index/vector_index.hpp"

#include <faiss/IndexFlat.h>
#include <faiss/utils/distances.h>

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <nlohmann/json.hpp>

#include "docqa_core/services/compression_service.hpp"
#include "docqa_core/services/hashing_service.hpp"

namespace docqa_core {

namespace {
constexpr int SNAPSHOT_VERSION = 1;
}

VectorIndex::VectorIndex(EmbeddingProvider& provider)
    : provider_(provider), dimension_(provider.dimension()) {}

VectorIndex::~VectorIndex() = default;

void VectorIndex::build(const std::vector<TextUnit>& units) {
  std::vector<std::string> texts;
  texts.reserve(units.size());
  for (const auto& unit : units) {
    texts.push_back(unit.content);
  }

  std::vector<EmbeddingVector> embeddings = provider_.embed(texts);
  if (embeddings.size() != units.size()) {
    throw VectorIndexError("Embedding provider returned " + std::to_string(embeddings.size()) +
                           " vectors for " + std::to_string(units.size()) + " units");
  }
  load(units, std::move(embeddings));
  std::cout << "[VectorIndex] Built index with " << units_.size() << " units" << std::endl;
}

void VectorIndex::load(std::vector<TextUnit> units, std::vector<EmbeddingVector> embeddings) {
  auto index = std::make_unique<faiss::IndexFlatIP>(static_cast<faiss::idx_t>(dimension_));

  if (!units.empty()) {
    // Inner product over unit-length copies is cosine similarity; zero rows stay zero
    std::vector<float> flat;
    flat.reserve(units.size() * dimension_);
    for (const auto& vec : embeddings) {
      if (vec.size() != dimension_) {
        throw VectorIndexError("Embedding dimension mismatch. Expected " +
                               std::to_string(dimension_) + ", got " + std::to_string(vec.size()));
      }
      flat.insert(flat.end(), vec.begin(), vec.end());
    }
    faiss::fvec_renorm_L2(dimension_, units.size(), flat.data());
    index->add(static_cast<faiss::idx_t>(units.size()), flat.data());
  }

  for (size_t i = 0; i < units.size(); ++i) {
    units[i].unit_index = static_cast<int>(i);
  }
  fingerprint_ = compute_fingerprint(units);
  units_ = std::move(units);
  embeddings_ = std::move(embeddings);
  faiss_index_ = std::move(index);
}

std::vector<TextUnit> VectorIndex::search(const std::string& query, int top_k) const {
  std::vector<TextUnit> results;
  for (auto& scored : search_scored(query, top_k)) {
    results.push_back(std::move(scored.unit));
  }
  return results;
}

std::vector<ScoredUnit> VectorIndex::search_scored(const std::string& query, int top_k) const {
  if (top_k <= 0 || empty()) {
    return {};
  }
  return search_vector(provider_.embed_one(query), top_k);
}

std::vector<ScoredUnit> VectorIndex::search_vector(const EmbeddingVector& query_vector,
                                                   int top_k) const {
  if (top_k <= 0 || empty() || !faiss_index_) {
    return {};
  }
  if (query_vector.size() != dimension_) {
    throw VectorIndexError("Query vector dimension mismatch. Expected " +
                           std::to_string(dimension_) + ", got " +
                           std::to_string(query_vector.size()));
  }

  std::vector<float> query = query_vector;
  faiss::fvec_renorm_L2(dimension_, 1, query.data());

  // Every entry is scored so ties can be ordered by document position below
  const faiss::idx_t total = faiss_index_->ntotal;
  std::vector<float> distances(total);
  std::vector<faiss::idx_t> labels(total);
  faiss_index_->search(1, query.data(), total, distances.data(), labels.data());

  std::vector<ScoredUnit> scored;
  scored.reserve(total);
  for (faiss::idx_t i = 0; i < total; ++i) {
    if (labels[i] < 0) {
      continue;
    }
    const auto position = static_cast<size_t>(labels[i]);
    scored.push_back({units_[position], distances[i], position});
  }

  std::sort(scored.begin(), scored.end(), [](const ScoredUnit& a, const ScoredUnit& b) {
    if (a.score != b.score) {
      return a.score > b.score;
    }
    return a.position < b.position;
  });

  if (scored.size() > static_cast<size_t>(top_k)) {
    scored.resize(static_cast<size_t>(top_k));
  }
  return scored;
}

std::string VectorIndex::compute_fingerprint(const std::vector<TextUnit>& units) {
  std::vector<std::string> fields;
  fields.reserve(units.size() * 2);
  for (const auto& unit : units) {
    fields.push_back(to_string(unit.kind));
    fields.push_back(unit.content);
  }
  return HashingService::sha256_hex(fields);
}

std::vector<char> VectorIndex::serialize() const {
  nlohmann::json units = nlohmann::json::array();
  for (const auto& unit : units_) {
    units.push_back({{"content", unit.content}, {"kind", to_string(unit.kind)}});
  }

  std::vector<std::uint8_t> raw(units_.size() * dimension_ * sizeof(float));
  size_t offset = 0;
  for (const auto& vec : embeddings_) {
    std::memcpy(raw.data() + offset, vec.data(), vec.size() * sizeof(float));
    offset += vec.size() * sizeof(float);
  }

  nlohmann::json snapshot = {{"version", SNAPSHOT_VERSION},
                             {"dimension", dimension_},
                             {"units", units},
                             {"embeddings", nlohmann::json::binary(std::move(raw))}};

  std::vector<std::uint8_t> packed = nlohmann::json::to_msgpack(snapshot);
  return CompressionService::compress(
      std::string_view(reinterpret_cast<const char*>(packed.data()), packed.size()));
}

std::shared_ptr<VectorIndex> VectorIndex::deserialize(const std::vector<char>& blob,
                                                      EmbeddingProvider& provider) {
  nlohmann::json snapshot;
  try {
    std::string packed = CompressionService::decompress(blob);
    snapshot = nlohmann::json::from_msgpack(packed);
  } catch (const nlohmann::json::exception& e) {
    throw VectorIndexError("Index snapshot is not valid MessagePack: " + std::string(e.what()));
  } catch (const std::runtime_error& e) {
    throw VectorIndexError("Index snapshot could not be decompressed: " + std::string(e.what()));
  }

  try {
    if (snapshot.at("version").get<int>() != SNAPSHOT_VERSION) {
      throw VectorIndexError("Unsupported index snapshot version");
    }
    const auto dimension = snapshot.at("dimension").get<size_t>();
    if (dimension != provider.dimension()) {
      throw VectorIndexError("Index snapshot dimension " + std::to_string(dimension) +
                             " does not match provider dimension " +
                             std::to_string(provider.dimension()));
    }

    std::vector<TextUnit> units;
    for (const auto& item : snapshot.at("units")) {
      TextUnit unit;
      unit.content = item.at("content").get<std::string>();
      unit.kind = unit_kind_from_string(item.at("kind").get<std::string>());
      units.push_back(std::move(unit));
    }

    const auto& raw = snapshot.at("embeddings").get_binary();
    if (raw.size() != units.size() * dimension * sizeof(float)) {
      throw VectorIndexError("Index snapshot embeddings do not match unit count");
    }
    std::vector<EmbeddingVector> embeddings(units.size(), EmbeddingVector(dimension));
    for (size_t i = 0; i < units.size(); ++i) {
      std::memcpy(embeddings[i].data(), raw.data() + i * dimension * sizeof(float),
                  dimension * sizeof(float));
    }

    auto index = std::make_shared<VectorIndex>(provider);
    index->load(std::move(units), std::move(embeddings));
    return index;
  } catch (const nlohmann::json::exception& e) {
    throw VectorIndexError("Index snapshot is malformed: " + std::string(e.what()));
  } catch (const std::invalid_argument& e) {
    throw VectorIndexError("Index snapshot is malformed: " + std::string(e.what()));
  }
}

}  // namespace docqa_core
