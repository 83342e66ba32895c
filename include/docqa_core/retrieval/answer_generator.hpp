#pragma once

#include <chrono>
#include <functional>
#include <string>

#include "docqa_core/async/cancellation_token.hpp"
#include "docqa_core/llm/model_clients.hpp"

namespace docqa_core {

inline constexpr const char* RATE_LIMIT_SENTINEL =
    "Error: Could not retrieve an answer after several retries due to rate limits.";
inline constexpr const char* API_ERROR_SENTINEL =
    "Error: Could not retrieve an answer due to an unexpected API error.";

struct RetryPolicy {
  int max_attempts = 5;
  std::chrono::milliseconds initial_backoff{1000};
  // Ceiling on the exponential part of the delay
  std::chrono::milliseconds max_backoff{30000};
  // Upper bound of the random delay added to each backoff
  std::chrono::milliseconds max_jitter{1000};
};

struct GenerationOutcome {
  std::string answer;
  // False when `answer` is one of the error sentinels
  bool succeeded = false;
};

/**
 * @brief Turns (context, question) into an answer with the generation model.
 *
 * Rate-limit errors are retried with exponential backoff plus jitter. Any other failure,
 * or running out of attempts, yields an error sentinel instead of an exception.
 * Cancellation is the exception: it is checked before every attempt, interrupts the
 * backoff wait, and surfaces as async::TaskCancelled.
 */
class AnswerGenerator {
 public:
  // Waits out a backoff delay; should return early once the token is cancelled
  using SleepFn = std::function<void(std::chrono::milliseconds, const async::CancellationToken&)>;

  AnswerGenerator(TextGenerationClient& client, RetryPolicy policy = {}, SleepFn sleep = nullptr);

  // An empty context asks the model to answer from general knowledge
  GenerationOutcome generate(const std::string& context, const std::string& question,
                             const async::CancellationToken& token = {});

  static std::string build_prompt(const std::string& context, const std::string& question);
  static const std::string& system_prompt();

  // Delay before retry number `attempt + 1`: min(initial * 2^attempt, max_backoff) + jitter
  std::chrono::milliseconds backoff_for(int attempt) const;

 private:
  TextGenerationClient& client_;
  RetryPolicy policy_;
  SleepFn sleep_;
};

}  // namespace docqa_core
