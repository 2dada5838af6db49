// =============================================================================
// agent_config_test.cpp
// =============================================================================
// Unit tests for amico::AgentConfig: defaults, JSON decoding and validation.
// =============================================================================

#include "amico/config/agent_config.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>

using namespace std::chrono_literals;

// =============================================================================
// Test 1: Defaults validate
// =============================================================================
TEST(AgentConfigTest, DefaultsAreValid) {
  amico::AgentConfig config;

  EXPECT_EQ(config.name, "amico");
  EXPECT_EQ(config.executor_workers, 2u);
  EXPECT_EQ(config.max_execution_history, 1024u);
  EXPECT_EQ(config.poll_interval, 20ms);
  EXPECT_FALSE(config.default_event_lifetime.has_value());
  EXPECT_FALSE(amico::validate(config).has_value());
}

// =============================================================================
// Test 2: Keys present in the document override defaults; others stay
// =============================================================================
TEST(AgentConfigTest, ParsesPartialDocument) {
  auto parsed = amico::parse_agent_config(R"({
    "name": "assistant",
    "executor_workers": 4,
    "drain_timeout_ms": 250,
    "default_event_lifetime_ms": 1000,
    "control_endpoint": "tcp://*:5555"
  })");

  ASSERT_TRUE(parsed.ok()) << *parsed.error;
  const amico::AgentConfig& config = *parsed.value;
  EXPECT_EQ(config.name, "assistant");
  EXPECT_EQ(config.executor_workers, 4u);
  EXPECT_EQ(config.drain_timeout, 250ms);
  ASSERT_TRUE(config.default_event_lifetime.has_value());
  EXPECT_EQ(*config.default_event_lifetime, 1000ms);
  EXPECT_EQ(config.control_endpoint, "tcp://*:5555");

  EXPECT_EQ(config.poll_interval, 20ms);
  EXPECT_EQ(config.system_wait_timeout, 30000ms);
  EXPECT_TRUE(config.event_endpoint.empty());
}

// =============================================================================
// Test 3: A null lifetime clears it; to_json writes null back
// =============================================================================
TEST(AgentConfigTest, NullLifetime) {
  auto parsed =
      amico::parse_agent_config(R"({"default_event_lifetime_ms": null})");
  ASSERT_TRUE(parsed.ok());
  EXPECT_FALSE(parsed.value->default_event_lifetime.has_value());

  nlohmann::json j = *parsed.value;
  EXPECT_TRUE(j.at("default_event_lifetime_ms").is_null());
  EXPECT_EQ(j.at("poll_interval_ms").get<int>(), 20);
}

// =============================================================================
// Test 4: Validation failures are reported, not thrown
// =============================================================================
TEST(AgentConfigTest, RejectsInvalidValues) {
  auto no_workers = amico::parse_agent_config(R"({"executor_workers": 0})");
  ASSERT_TRUE(no_workers.failed());
  EXPECT_NE(no_workers.error->find("executor_workers"), std::string::npos);

  auto negative_workers =
      amico::parse_agent_config(R"({"executor_workers": -1})");
  ASSERT_TRUE(negative_workers.failed());
  EXPECT_NE(negative_workers.error->find("executor_workers"),
            std::string::npos);

  auto negative_history =
      amico::parse_agent_config(R"({"max_execution_history": -3})");
  ASSERT_TRUE(negative_history.failed());
  EXPECT_NE(negative_history.error->find("max_execution_history"),
            std::string::npos);

  auto bad_poll = amico::parse_agent_config(R"({"poll_interval_ms": 0})");
  ASSERT_TRUE(bad_poll.failed());

  auto bad_lifetime =
      amico::parse_agent_config(R"({"default_event_lifetime_ms": -5})");
  ASSERT_TRUE(bad_lifetime.failed());

  amico::AgentConfig unnamed;
  unnamed.name.clear();
  EXPECT_TRUE(amico::validate(unnamed).has_value());
}

// =============================================================================
// Test 5: Malformed JSON and wrong types fail with a message
// =============================================================================
TEST(AgentConfigTest, RejectsMalformedDocuments) {
  auto not_json = amico::parse_agent_config("{ nope");
  ASSERT_TRUE(not_json.failed());
  EXPECT_NE(not_json.error->find("invalid config"), std::string::npos);

  auto wrong_type = amico::parse_agent_config(R"({"name": 42})");
  ASSERT_TRUE(wrong_type.failed());

  auto not_object = amico::parse_agent_config("[1, 2, 3]");
  ASSERT_TRUE(not_object.failed());
  EXPECT_EQ(*not_object.error, "config must be a JSON object");
}
