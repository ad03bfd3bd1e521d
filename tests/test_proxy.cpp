#include "chat_codec.hpp"
#include "event_reporter.hpp"
#include "event_store.hpp"
#include "proxy.hpp"
#include "request_filter.hpp"

#include <doctest/doctest.h>

#include <string>

TEST_SUITE_BEGIN("contextfilter.proxy");

namespace {

using contextfilter::EventReporter;
using contextfilter::EventStore;
using contextfilter::ProxyHandler;
using contextfilter::RequestFilter;
using contextfilter::Role;

const std::string kProjectTree = "<project>\\nsrc/\\n  main.cpp\\n  proxy.cpp\\n</project>";

std::string chatBody(const std::string& model, const std::string& system_prompt) {
  return R"({"model": ")" + model + R"(", "stream": false, "messages": [)" +
         R"({"role": "system", "content": ")" + system_prompt + R"("},)" +
         R"({"role": "user", "content": "hi"}]})";
}

struct ProxyFixture {
  ProxyFixture() : filter({"llama3.2:1b"}), handler(store, filter, reporter) {
    REQUIRE_FALSE(store.init(":memory:").has_value());
  }

  EventStore store;
  RequestFilter filter;
  EventReporter reporter;
  ProxyHandler handler;
};

} // namespace

TEST_CASE_FIXTURE(ProxyFixture, "undecodable bodies are forwarded unchanged") {
  const std::string samples[] = {
      "this is not json",
      chatBody("", "You are helpful."),
      R"({"model": "llama3.2:1b", "messages": [{"role": "developer", "content": "x"}]})",
  };
  for (const auto& body : samples) {
    CAPTURE(body);
    auto result = handler.filterBody(body);
    CHECK(result.state == "SKIPPED");
    CHECK(result.body == body);
  }

  store.flush();
  auto events = store.getEvents();
  REQUIRE(events.has_value());
  CHECK(events->empty());
}

TEST_CASE_FIXTURE(ProxyFixture, "models outside the allow-list pass through byte for byte") {
  const std::string body = chatBody("qwen2.5:7b", "Intro. " + kProjectTree);
  auto result = handler.filterBody(body);
  CHECK(result.state == "PASSTHROUGH");
  CHECK(result.body == body);

  store.flush();
  auto events = store.getEvents();
  REQUIRE(events.has_value());
  REQUIRE(events->size() == 1);
  CHECK((*events)[0].model == "qwen2.5:7b");
  CHECK_FALSE((*events)[0].filtered);
}

TEST_CASE_FIXTURE(ProxyFixture, "allow-listed models get their system prompt filtered") {
  const std::string body = chatBody("llama3.2:1b", "Intro. " + kProjectTree);
  auto result = handler.filterBody(body);
  CHECK(result.state == "FILTERED");
  CHECK(result.body != body);

  auto forwarded = contextfilter::decodeChatRequest(result.body);
  CHECK(forwarded.model == "llama3.2:1b");
  REQUIRE(forwarded.messages.size() == 2);
  CHECK(forwarded.messages[0].role == Role::System);
  CHECK(forwarded.messages[0].content.find("<project>") == std::string::npos);
  CHECK(forwarded.messages[0].content.rfind("Intro. ", 0) == 0);
  CHECK(forwarded.messages[0].content.find("<environment>") != std::string::npos);
  CHECK(forwarded.messages[1].content == "hi");

  store.flush();
  auto events = store.getEvents();
  REQUIRE(events.has_value());
  REQUIRE(events->size() == 1);
  const auto& event = (*events)[0];
  CHECK(event.model == "llama3.2:1b");
  CHECK(event.filtered);
  CHECK(event.sections_removed.rfind("project-tree:", 0) == 0);
  CHECK(event.records.find("[FILTER] SUMMARY model=llama3.2:1b") != std::string::npos);
}

TEST_SUITE_END();
