#pragma once

#include <functional>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace docqa_core {

enum class RouteAction { Retrieve, GeneralKnowledge, FixedAnswer };

std::string to_string(RouteAction action);

using QuestionPredicate = std::function<bool(const std::string&)>;

struct OverrideRule {
  std::string name;
  QuestionPredicate predicate;
  RouteAction action = RouteAction::GeneralKnowledge;
  // Only used by FixedAnswer rules
  std::string fixed_answer;
};

struct RouteDecision {
  RouteAction action = RouteAction::Retrieve;
  std::string rule_name;
  std::string fixed_answer;
};

/**
 * @brief Ordered override table evaluated before the retrieval pipeline.
 *
 * The first rule whose predicate matches decides the route. With no match, or an
 * empty table, the question goes through retrieval.
 */
class QuestionRouter {
 public:
  QuestionRouter() = default;
  explicit QuestionRouter(std::vector<OverrideRule> rules);

  RouteDecision route(const std::string& question) const;

  void add_rule(OverrideRule rule);
  size_t size() const {
    return rules_.size();
  }

  // Case-insensitive: true when the question contains any of the keywords
  static QuestionPredicate keywords_any(std::vector<std::string> keywords);
  // Case-insensitive ECMAScript search anywhere in the question
  static QuestionPredicate matches_regex(const std::string& pattern);

  /**
   * @brief Builds a router from a JSON rule list.
   *
   * Each entry: {"name", "keywords": [...] | "pattern": "...", "answer"?}. Entries with
   * an "answer" become FixedAnswer rules, others GeneralKnowledge rules.
   * @throws std::runtime_error on malformed entries.
   */
  static QuestionRouter from_json(const nlohmann::json& rules);

 private:
  std::vector<OverrideRule> rules_;
};

}  // namespace docqa_core
