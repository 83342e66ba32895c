#include "docqa_core/retrieval/answer_generator.hpp"

#include <algorithm>
#include <iostream>
#include <limits>
#include <random>

#include "docqa_core/segmentation/segmentation_strategy.hpp"

namespace docqa_core {

AnswerGenerator::AnswerGenerator(TextGenerationClient& client, RetryPolicy policy, SleepFn sleep)
    : client_(client), policy_(policy), sleep_(std::move(sleep)) {
  if (policy_.max_attempts <= 0) {
    policy_.max_attempts = 1;
  }
  if (policy_.max_backoff < policy_.initial_backoff) {
    policy_.max_backoff = policy_.initial_backoff;
  }
  if (!sleep_) {
    sleep_ = [](std::chrono::milliseconds delay, const async::CancellationToken& token) {
      token.wait_for(delay);
    };
  }
}

const std::string& AnswerGenerator::system_prompt() {
  static const std::string prompt =
      "You are an expert assistant answering questions about documents.\n"
      "1. Give clear, accurate answers that keep the key terms of the source.\n"
      "2. State information as fact, without phrases such as \"According to\" or \"Based on\".\n"
      "3. When the answer is a list of documents, rules or items, include every item exactly "
      "as given in the context.\n"
      "4. Refuse requests for illegal or unethical content.\n"
      "5. If the context does not contain the answer, say that it is not present in the "
      "document.\n"
      "Get straight to the point.";
  return prompt;
}

std::string AnswerGenerator::build_prompt(const std::string& context, const std::string& question) {
  if (context.empty()) {
    return "Answer the question below directly and concisely.\n"
           "Question: " + question + "\nAnswer:";
  }
  return "Using the context below, answer the question directly and concisely. Do not mention "
         "sources or use attribution phrases.\n"
         "Context: " + context + "\nQuestion: " + question + "\nAnswer:";
}

std::chrono::milliseconds AnswerGenerator::backoff_for(int attempt) const {
  // 2^30 already exceeds any sane cap; larger shifts would overflow
  const int exponent = std::clamp(attempt, 0, 30);
  const long long cap = policy_.max_backoff.count();
  const long long initial = std::max<long long>(policy_.initial_backoff.count(), 0);
  long long base = cap;
  if (initial <= cap >> exponent) {
    base = std::min(initial << exponent, cap);
  }

  thread_local std::mt19937 rng{std::random_device{}()};
  std::uniform_int_distribution<long long> jitter(
      0, std::max<long long>(policy_.max_jitter.count(), 0));
  const long long extra = jitter(rng);
  if (base > std::numeric_limits<long long>::max() - extra) {
    return std::chrono::milliseconds(std::numeric_limits<long long>::max());
  }
  return std::chrono::milliseconds(base + extra);
}

GenerationOutcome AnswerGenerator::generate(const std::string& context, const std::string& question,
                                            const async::CancellationToken& token) {
  GenerationRequest request;
  request.system_prompt = system_prompt();
  request.prompt = build_prompt(context, question);

  for (int attempt = 0; attempt < policy_.max_attempts; ++attempt) {
    async::throw_if_cancelled(token);
    try {
      std::string answer = trim_whitespace(client_.generate(request));
      return {std::move(answer), true};
    } catch (const RateLimitError& e) {
      if (attempt + 1 == policy_.max_attempts) {
        std::cerr << "[AnswerGenerator] Rate limited on final attempt: " << e.what() << std::endl;
        break;
      }
      const auto delay = backoff_for(attempt);
      std::cerr << "[AnswerGenerator] Rate limit exceeded. Retrying in " << delay.count() << " ms"
                << std::endl;
      sleep_(delay, token);
    } catch (const std::exception& e) {
      std::cerr << "[AnswerGenerator] Unexpected generation error: " << e.what() << std::endl;
      return {API_ERROR_SENTINEL, false};
    }
  }
  return {RATE_LIMIT_SENTINEL, false};
}

}  // namespace docqa_core
