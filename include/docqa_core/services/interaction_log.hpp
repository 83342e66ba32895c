#pragma once

#include <chrono>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace docqa_core {

// Appends one JSON object per answered request to a JSON Lines file
class InteractionLog {
 public:
  // An empty path disables logging
  explicit InteractionLog(std::filesystem::path path);

  void record(const std::string& document, const std::vector<std::string>& questions,
              const std::vector<std::string>& answers, std::chrono::milliseconds elapsed);

  bool enabled() const {
    return !path_.empty();
  }

  static std::string utc_timestamp();

 private:
  std::filesystem::path path_;
  std::mutex mtx_;
};

}  // namespace docqa_core
