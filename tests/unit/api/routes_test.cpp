#include "docqa_api/routes.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "../../common/utilities_test.hpp"

namespace docqa_tests {

using docqa_api::RequestError;
using docqa_api::Routes;
using ::testing::_;

TEST(RoutesParseTest, AcceptsDocumentAndQuestions) {
  auto request = Routes::parse_run_request(
      R"({"documents": "https://example.com/a.txt", "questions": ["q1", "q2"]})");
  EXPECT_EQ(request.document_url, "https://example.com/a.txt");
  ASSERT_EQ(request.questions.size(), 2u);
  EXPECT_EQ(request.questions[1], "q2");
}

TEST(RoutesParseTest, EmptyQuestionListIsAllowed) {
  auto request =
      Routes::parse_run_request(R"({"documents": "https://example.com/a.txt", "questions": []})");
  EXPECT_TRUE(request.questions.empty());
}

TEST(RoutesParseTest, RejectsMalformedBodies) {
  EXPECT_THROW(Routes::parse_run_request("not json"), RequestError);
  EXPECT_THROW(Routes::parse_run_request("[]"), RequestError);
  EXPECT_THROW(Routes::parse_run_request(R"({"questions": ["q"]})"), RequestError);
  EXPECT_THROW(Routes::parse_run_request(R"({"documents": "u"})"), RequestError);
  EXPECT_THROW(Routes::parse_run_request(R"({"documents": "u", "questions": "q"})"),
               RequestError);
  EXPECT_THROW(Routes::parse_run_request(R"({"documents": "u", "questions": ["q", 3]})"),
               RequestError);
  EXPECT_THROW(Routes::parse_run_request(R"({"documents": "", "questions": ["q"]})"),
               RequestError);
}

TEST(RoutesAuthTest, ChecksBearerToken) {
  Routes routes(nullptr, "secret");

  crow::request missing;
  EXPECT_FALSE(routes.is_authorized(missing));

  crow::request wrong;
  wrong.add_header("Authorization", "Bearer nope");
  EXPECT_FALSE(routes.is_authorized(wrong));

  crow::request no_scheme;
  no_scheme.add_header("Authorization", "secret");
  EXPECT_FALSE(routes.is_authorized(no_scheme));

  crow::request good;
  good.add_header("Authorization", "Bearer secret");
  EXPECT_TRUE(routes.is_authorized(good));
}

TEST(RoutesAuthTest, EmptyTokenDisablesAuthentication) {
  Routes routes(nullptr, "");
  crow::request req;
  EXPECT_TRUE(routes.is_authorized(req));
}

TEST(RoutesHandlerTest, RejectsUnauthorizedAndMalformedRequests) {
  Routes routes(nullptr, "secret");

  crow::request unauthorized;
  unauthorized.body = R"({"documents": "u", "questions": ["q"]})";
  EXPECT_EQ(routes.handle_run(unauthorized).code, 403);

  crow::request malformed;
  malformed.add_header("Authorization", "Bearer secret");
  malformed.body = R"({"documents": 42})";
  auto response = routes.handle_run(malformed);
  EXPECT_EQ(response.code, 400);
  auto body = nlohmann::json::parse(response.body);
  EXPECT_FALSE(body["success"].get<bool>());
  EXPECT_FALSE(body["error"].get<std::string>().empty());
}

TEST(RoutesHandlerTest, HealthCheck) {
  Routes routes(nullptr, "secret");
  crow::request req;
  auto response = routes.handle_health_check(req);
  EXPECT_EQ(response.code, 200);
  EXPECT_EQ(nlohmann::json::parse(response.body)["status"], "healthy");
}

class RoutesRunTest : public DocumentQaServiceTestBase {
 protected:
  void SetUp() override {
    DocumentQaServiceTestBase::SetUp();
    ON_CALL(generation_client_, generate(_))
        .WillByDefault([](const docqa_core::GenerationRequest& request) {
          if (request.json_output) {
            return std::string("[]");
          }
          return "answer: " + MockUtilities::question_from_prompt(request.prompt);
        });
  }
};

TEST_F(RoutesRunTest, ReturnsAnswersInQuestionOrder) {
  serve_document("Claims must be filed within 30 days.\n\nThe deductible is 500 dollars.");
  Routes routes(service_, "secret");

  crow::request req;
  req.add_header("Authorization", "Bearer secret");
  req.body = R"({"documents": "https://example.com/p.txt",
                 "questions": ["When are claims due?", "What is the deductible?"]})";

  auto response = routes.handle_run(req);
  ASSERT_EQ(response.code, 200);
  auto body = nlohmann::json::parse(response.body);
  ASSERT_TRUE(body["answers"].is_array());
  ASSERT_EQ(body["answers"].size(), 2u);
  EXPECT_EQ(body["answers"][0], "answer: When are claims due?");
  EXPECT_EQ(body["answers"][1], "answer: What is the deductible?");
}

TEST_F(RoutesRunTest, UnreachableDocumentStillAnswersEveryQuestion) {
  ON_CALL(*fetcher_, fetch(_))
      .WillByDefault(testing::Throw(docqa_core::DocumentFetchError("connection refused")));
  Routes routes(service_, "");

  crow::request req;
  req.body = R"({"documents": "https://example.com/p.txt", "questions": ["a", "b", "c"]})";

  auto response = routes.handle_run(req);
  ASSERT_EQ(response.code, 200);
  auto body = nlohmann::json::parse(response.body);
  ASSERT_EQ(body["answers"].size(), 3u);
  for (const auto& answer : body["answers"]) {
    EXPECT_EQ(answer, docqa_core::INGESTION_ERROR_SENTINEL);
  }
}

}  // namespace docqa_tests
