#include <gtest/gtest.h>

#include "finagent/provider_client.hpp"
#include "finagent/runs.hpp"
#include "support/mock_http_client.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace ft = finagent::testing;

TEST(RunsResourceTest, CreatePostsToThreadRuns) {
  using namespace finagent;

  auto mock_client = std::make_unique<ft::MockHttpClient>();
  auto* mock_ptr = mock_client.get();
  mock_ptr->enqueue_json(200, R"({
    "id": "run_1",
    "object": "thread.run",
    "thread_id": "thread_1",
    "assistant_id": "asst_123",
    "status": "queued",
    "created_at": 1700000000,
    "metadata": {"quarter": "Q1"}
  })");

  ProviderOptions options;
  options.api_key = "sk-test";
  ProviderClient client(options, std::move(mock_client));

  RunCreateRequest request;
  request.assistant_id = "asst_123";
  request.instructions = "Summarise";
  request.metadata["quarter"] = "Q1";
  request.response_format = json{{"type", "json_object"}};

  auto run = client.runs().create("thread_1", request);

  EXPECT_EQ(run.id, "run_1");
  EXPECT_EQ(run.thread_id, "thread_1");
  EXPECT_EQ(run.status, std::optional<std::string>("queued"));
  EXPECT_EQ(run.assistant_id, std::optional<std::string>("asst_123"));
  ASSERT_TRUE(run.created_at.has_value());
  EXPECT_DOUBLE_EQ(*run.created_at, 1700000000.0);
  EXPECT_FALSE(run.dashboard_url.has_value());
  EXPECT_EQ(run.metadata.at("quarter"), "Q1");

  auto http_request = mock_ptr->last_request();
  ASSERT_TRUE(http_request.has_value());
  EXPECT_EQ(http_request->url, "https://api.openai.com/v1/threads/thread_1/runs");

  auto body = json::parse(http_request->body);
  EXPECT_EQ(body["assistant_id"], "asst_123");
  EXPECT_EQ(body["instructions"], "Summarise");
  EXPECT_EQ(body["metadata"], json::parse(R"({"quarter":"Q1"})"));
  EXPECT_EQ(body["response_format"], json::parse(R"({"type":"json_object"})"));
}

TEST(RunsResourceTest, OmitsUnsetOptionalFields) {
  using namespace finagent;

  auto mock_client = std::make_unique<ft::MockHttpClient>();
  auto* mock_ptr = mock_client.get();
  mock_ptr->enqueue_json(200, R"({"id":"run_2","created_at":true,"status":"requires_action"})");

  ProviderOptions options;
  options.api_key = "sk-test";
  ProviderClient client(options, std::move(mock_client));

  RunCreateRequest request;
  request.assistant_id = "asst_123";
  auto run = client.runs().create("thread_9", request);

  EXPECT_EQ(run.status, std::optional<std::string>("requires_action"));
  EXPECT_FALSE(run.created_at.has_value());

  auto body = json::parse(mock_ptr->last_request()->body);
  EXPECT_EQ(body, json::parse(R"({"assistant_id":"asst_123"})"));
}
