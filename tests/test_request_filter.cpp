#include "request_filter.hpp"
#include "token_estimator.hpp"

#include <doctest/doctest.h>

#include <string>

TEST_SUITE_BEGIN("contextfilter.request_filter");

namespace {

using contextfilter::ChatMessage;
using contextfilter::ChatRequest;
using contextfilter::RequestFilter;
using contextfilter::Role;

const std::string kStub = contextfilter::kEnvironmentStub;

RequestFilter makeFilter() {
  return RequestFilter({"llama3.2:1b", "llama3.2-1b", "qwen2.5:1.5b", "qwen2.5-1.5b"});
}

ChatRequest makeRequest(const std::string& model) {
  ChatRequest request;
  request.model = model;
  request.messages = {
      {Role::System, "Base prompt.<project>\n  src/\n</project>"},
      {Role::User, "Write a fibonacci function <env>not removed</env>"},
      {Role::System, "Second system prompt."},
      {Role::Assistant, "Sure."},
  };
  return request;
}

} // namespace

TEST_CASE("model outside the allow-list passes through untouched") {
  auto filter = makeFilter();
  auto request = makeRequest("qwen2.5:7b");

  auto result = filter.process(request);

  CHECK(result.request == request);
  CHECK_FALSE(result.stats.filtered);
  CHECK(result.stats.model == "qwen2.5:7b");
  CHECK(result.stats.message_count == 4);
  CHECK(result.stats.outcomes.empty());
  CHECK(result.stats.passthrough.empty());
  CHECK(result.stats.original_chars == 0);
  CHECK(result.stats.filtered_chars == 0);
  CHECK(result.stats.reductionPercent() == 0.0);
}

TEST_CASE("only system messages are rewritten for allow-listed models") {
  auto filter = makeFilter();
  auto request = makeRequest("llama3.2:1b");

  auto result = filter.process(request);

  REQUIRE(result.request.messages.size() == request.messages.size());
  CHECK(result.stats.filtered);
  CHECK(result.request.model == "llama3.2:1b");
  for (size_t i = 0; i < request.messages.size(); ++i) {
    CHECK(result.request.messages[i].role == request.messages[i].role);
  }
  CHECK(result.request.messages[0].content == "Base prompt." + kStub);
  CHECK(result.request.messages[1] == request.messages[1]);
  CHECK(result.request.messages[2].content == "Second system prompt." + kStub);
  CHECK(result.request.messages[3] == request.messages[3]);
}

TEST_CASE("stats record filtered and passthrough messages separately") {
  auto filter = makeFilter();
  auto request = makeRequest("qwen2.5-1.5b");

  auto result = filter.process(request);
  const auto& stats = result.stats;

  REQUIRE(stats.outcomes.size() == 2);
  CHECK(stats.outcomes[0].index == 0);
  CHECK(stats.outcomes[1].index == 2);
  CHECK(stats.outcomes[0].outcome.removed.size() == 1);
  CHECK(stats.outcomes[1].outcome.removed.empty());

  REQUIRE(stats.passthrough.size() == 2);
  CHECK(stats.passthrough[0].index == 1);
  CHECK(stats.passthrough[0].role == Role::User);
  CHECK(stats.passthrough[0].chars == request.messages[1].content.size());
  CHECK(stats.passthrough[0].tokens ==
        contextfilter::estimateTokens(request.messages[1].content));
  CHECK(stats.passthrough[1].index == 3);
  CHECK(stats.passthrough[1].role == Role::Assistant);

  // Totals cover system messages only
  size_t original = request.messages[0].content.size() + request.messages[2].content.size();
  size_t filtered = result.request.messages[0].content.size() +
                    result.request.messages[2].content.size();
  CHECK(stats.original_chars == original);
  CHECK(stats.filtered_chars == filtered);
  CHECK(stats.original_tokens == stats.outcomes[0].outcome.original_tokens +
                                     stats.outcomes[1].outcome.original_tokens);
  CHECK(stats.filtered_tokens == stats.outcomes[0].outcome.filtered_tokens +
                                     stats.outcomes[1].outcome.filtered_tokens);
  CHECK(stats.filter_time ==
        stats.outcomes[0].outcome.elapsed + stats.outcomes[1].outcome.elapsed);
}

TEST_CASE("request without system messages is filtered but unchanged") {
  auto filter = makeFilter();
  ChatRequest request;
  request.model = "llama3.2:1b";
  request.messages = {{Role::User, "hi"}, {Role::Tool, "{\"ok\":true}"}};

  auto result = filter.process(request);

  CHECK(result.stats.filtered);
  CHECK(result.request == request);
  CHECK(result.stats.outcomes.empty());
  CHECK(result.stats.passthrough.size() == 2);
  CHECK(result.stats.reductionPercent() == 0.0);
}

TEST_CASE("empty message list is preserved") {
  auto filter = makeFilter();
  ChatRequest request;
  request.model = "llama3.2:1b";

  auto result = filter.process(request);
  CHECK(result.request.messages.empty());
  CHECK(result.stats.message_count == 0);
}

TEST_CASE("missing model id is an invalid request") {
  auto filter = makeFilter();
  ChatRequest request;
  request.messages = {{Role::System, "prompt"}};
  CHECK_THROWS_AS((void)filter.process(request), contextfilter::InvalidRequest);
}

TEST_CASE("reduction percentage stays within 0 and 100") {
  using contextfilter::reductionPercent;
  CHECK(reductionPercent(0, 0) == 0.0);
  CHECK(reductionPercent(0, 10) == 0.0);
  CHECK(reductionPercent(100, 25) == doctest::Approx(75.0));
  CHECK(reductionPercent(100, 0) == doctest::Approx(100.0));
  CHECK(reductionPercent(100, 100) == 0.0);
  CHECK(reductionPercent(100, 150) == 0.0);
}

TEST_CASE("large prompt reduction is reported") {
  auto filter = makeFilter();
  ChatRequest request;
  request.model = "llama3.2-1b";
  request.messages = {
      {Role::System, "Intro.\n\n<project>\n" + std::string(5000, 'f') + "\n</project>"},
  };

  auto result = filter.process(request);
  double reduction = result.stats.reductionPercent();
  CHECK(reduction > 90.0);
  CHECK(reduction <= 100.0);
}

TEST_SUITE_END();
