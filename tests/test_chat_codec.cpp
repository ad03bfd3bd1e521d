#include "chat_codec.hpp"

#include <doctest/doctest.h>

#include <crow.h>

#include <string>

TEST_SUITE_BEGIN("contextfilter.chat_codec");

namespace {

using contextfilter::ChatRequest;
using contextfilter::InvalidRequest;
using contextfilter::Role;
using contextfilter::decodeChatRequest;
using contextfilter::encodeChatRequest;

const std::string kBody = R"({
  "model": "llama3.2:1b",
  "stream": true,
  "max_tokens": 50,
  "messages": [
    {"role": "system", "content": "You are helpful.<env>x</env>"},
    {"role": "user", "content": "What is 2+2?"},
    {"role": "assistant", "content": null, "tool_calls": [{"id": "call_1"}]},
    {"role": "tool", "content": "4"}
  ]
})";

} // namespace

TEST_CASE("chat body decodes into model and messages") {
  auto request = decodeChatRequest(kBody);
  CHECK(request.model == "llama3.2:1b");
  REQUIRE(request.messages.size() == 4);
  CHECK(request.messages[0].role == Role::System);
  CHECK(request.messages[0].content == "You are helpful.<env>x</env>");
  CHECK(request.messages[1].role == Role::User);
  CHECK(request.messages[1].content == "What is 2+2?");
  CHECK(request.messages[2].role == Role::Assistant);
  CHECK(request.messages[2].content.empty());
  CHECK(request.messages[3].role == Role::Tool);
}

TEST_CASE("malformed bodies are invalid requests") {
  CHECK_THROWS_AS((void)decodeChatRequest("not json"), InvalidRequest);
  CHECK_THROWS_AS((void)decodeChatRequest("[1, 2]"), InvalidRequest);
  CHECK_THROWS_AS((void)decodeChatRequest(R"({"messages": []})"), InvalidRequest);
  CHECK_THROWS_AS((void)decodeChatRequest(R"({"model": 7, "messages": []})"), InvalidRequest);
  CHECK_THROWS_AS((void)decodeChatRequest(R"({"model": "m"})"), InvalidRequest);
  CHECK_THROWS_AS((void)decodeChatRequest(R"({"model": "m", "messages": {}})"), InvalidRequest);
  CHECK_THROWS_AS((void)decodeChatRequest(R"({"model": "m", "messages": ["hi"]})"), InvalidRequest);
}

TEST_CASE("messages need a known role") {
  CHECK_THROWS_AS(
      (void)decodeChatRequest(R"({"model": "m", "messages": [{"content": "x"}]})"),
      InvalidRequest);
  CHECK_THROWS_AS(
      (void)decodeChatRequest(R"({"model": "m", "messages": [{"role": "developer", "content": "x"}]})"),
      InvalidRequest);
}

TEST_CASE("system messages need text content") {
  CHECK_THROWS_AS(
      (void)decodeChatRequest(R"({"model": "m", "messages": [{"role": "system", "content": null}]})"),
      InvalidRequest);
  CHECK_THROWS_AS(
      (void)decodeChatRequest(R"({"model": "m", "messages": [{"role": "system"}]})"),
      InvalidRequest);
}

TEST_CASE("encoding replaces system content and keeps everything else") {
  auto request = decodeChatRequest(kBody);
  request.messages[0].content = "You are helpful.";

  auto encoded = encodeChatRequest(kBody, request);
  auto json = crow::json::load(encoded);
  REQUIRE(json);

  CHECK(std::string(json["model"].s()) == "llama3.2:1b");
  CHECK(json["stream"].b());
  CHECK(json["max_tokens"].i() == 50);
  REQUIRE(json["messages"].size() == 4);
  CHECK(std::string(json["messages"][0]["content"].s()) == "You are helpful.");
  CHECK(std::string(json["messages"][1]["content"].s()) == "What is 2+2?");
  CHECK(json["messages"][2]["content"].t() == crow::json::type::Null);
  CHECK(std::string(json["messages"][2]["tool_calls"][0]["id"].s()) == "call_1");
  CHECK(std::string(json["messages"][3]["content"].s()) == "4");

  CHECK(decodeChatRequest(encoded) == request);
}

TEST_CASE("encoding rejects a request that does not line up with the body") {
  auto request = decodeChatRequest(kBody);
  request.messages.pop_back();
  CHECK_THROWS_AS((void)encodeChatRequest(kBody, request), InvalidRequest);
}

TEST_SUITE_END();
