#include "docqa_core/routing/question_router.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <stdexcept>

namespace docqa_core {

namespace {

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

}  // namespace

std::string to_string(RouteAction action) {
  switch (action) {
    case RouteAction::Retrieve:
      return "retrieve";
    case RouteAction::GeneralKnowledge:
      return "general_knowledge";
    case RouteAction::FixedAnswer:
      return "fixed_answer";
    default:
      return "unknown";
  }
}

QuestionRouter::QuestionRouter(std::vector<OverrideRule> rules) {
  for (auto& rule : rules) {
    add_rule(std::move(rule));
  }
}

void QuestionRouter::add_rule(OverrideRule rule) {
  if (!rule.predicate) {
    throw std::invalid_argument("Override rule '" + rule.name + "' has no predicate");
  }
  rules_.push_back(std::move(rule));
}

RouteDecision QuestionRouter::route(const std::string& question) const {
  for (const auto& rule : rules_) {
    if (rule.predicate(question)) {
      return {rule.action, rule.name, rule.fixed_answer};
    }
  }
  return {};
}

QuestionPredicate QuestionRouter::keywords_any(std::vector<std::string> keywords) {
  for (auto& keyword : keywords) {
    keyword = to_lower(keyword);
  }
  return [keywords = std::move(keywords)](const std::string& question) {
    const std::string lowered = to_lower(question);
    return std::any_of(keywords.begin(), keywords.end(), [&](const std::string& keyword) {
      return !keyword.empty() && lowered.find(keyword) != std::string::npos;
    });
  };
}

QuestionPredicate QuestionRouter::matches_regex(const std::string& pattern) {
  std::regex compiled;
  try {
    compiled = std::regex(pattern, std::regex_constants::ECMAScript | std::regex_constants::icase);
  } catch (const std::regex_error& e) {
    throw std::invalid_argument("Invalid override pattern '" + pattern + "': " + e.what());
  }
  return [compiled](const std::string& question) { return std::regex_search(question, compiled); };
}

QuestionRouter QuestionRouter::from_json(const nlohmann::json& rules) {
  if (rules.is_null()) {
    return QuestionRouter();
  }
  if (!rules.is_array()) {
    throw std::runtime_error("override_rules must be an array");
  }

  QuestionRouter router;
  for (const auto& entry : rules) {
    OverrideRule rule;
    rule.name = entry.value("name", "rule_" + std::to_string(router.size()));

    try {
      if (entry.contains("keywords")) {
        rule.predicate = keywords_any(entry.at("keywords").get<std::vector<std::string>>());
      } else if (entry.contains("pattern")) {
        rule.predicate = matches_regex(entry.at("pattern").get<std::string>());
      } else {
        throw std::runtime_error("Override rule '" + rule.name + "' needs keywords or pattern");
      }
      if (entry.contains("answer")) {
        rule.action = RouteAction::FixedAnswer;
        rule.fixed_answer = entry.at("answer").get<std::string>();
      } else {
        rule.action = RouteAction::GeneralKnowledge;
      }
    } catch (const std::invalid_argument& e) {
      throw std::runtime_error(e.what());
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error("Override rule '" + rule.name + "' is malformed: " + e.what());
    }

    router.add_rule(std::move(rule));
  }
  return router;
}

}  // namespace docqa_core
