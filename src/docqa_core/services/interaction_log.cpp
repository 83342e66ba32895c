#include "docqa_core/services/interaction_log.hpp"

#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace docqa_core {

InteractionLog::InteractionLog(std::filesystem::path path) : path_(std::move(path)) {}

std::string InteractionLog::utc_timestamp() {
  const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  gmtime_r(&now, &tm);
  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return out.str();
}

void InteractionLog::record(const std::string& document, const std::vector<std::string>& questions,
                            const std::vector<std::string>& answers,
                            std::chrono::milliseconds elapsed) {
  if (!enabled()) {
    return;
  }

  nlohmann::json entry = {{"timestamp", utc_timestamp()},
                          {"document", document},
                          {"questions", questions},
                          {"answers", answers},
                          {"elapsed_ms", elapsed.count()}};
  // Invalid UTF-8 in a document URL or answer must not abort the write
  const std::string line = entry.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

  std::lock_guard<std::mutex> lock(mtx_);
  std::error_code ec;
  if (path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path(), ec);
  }
  std::ofstream out(path_, std::ios::app);
  if (!out) {
    std::cerr << "[InteractionLog] Could not open " << path_ << " for writing" << std::endl;
    return;
  }
  out << line << '\n';
  if (!out) {
    std::cerr << "[InteractionLog] Write to " << path_ << " failed" << std::endl;
  }
}

}  // namespace docqa_core
