#include "taskhive/task/task.hpp"

#include "test_utils.hpp"

#include <nlohmann/json.hpp>

#include "gtest/gtest.h"

using namespace taskhive;
using namespace std::chrono_literals;

TEST(TaskTest, Defaults) {
  Task t;

  EXPECT_EQ(t.priority, Priority::Medium);
  EXPECT_EQ(t.status, TaskStatus::Pending);
  EXPECT_EQ(t.max_retries, 3);
  EXPECT_EQ(t.retry_count, 0);
  EXPECT_EQ(t.timeout, 300s);
  EXPECT_FALSE(t.scheduled_time.has_value());
}

TEST(TaskTest, PriorityNames_RoundTrip) {
  for (auto p : {Priority::Critical, Priority::High, Priority::Medium,
                 Priority::Low, Priority::Batch}) {
    auto parsed = parse_priority(priority_name(p));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, p);
  }
  EXPECT_EQ(parse_priority("HIGH"), Priority::High);
  EXPECT_FALSE(parse_priority("urgent").has_value());
}

TEST(TaskTest, PriorityFromValue_AcceptsOneToFive) {
  EXPECT_EQ(priority_from_value(1), Priority::Critical);
  EXPECT_EQ(priority_from_value(5), Priority::Batch);
  EXPECT_FALSE(priority_from_value(0).has_value());
  EXPECT_FALSE(priority_from_value(6).has_value());
}

TEST(TaskTest, StatusNames_RoundTrip) {
  for (auto s : {TaskStatus::Pending, TaskStatus::Queued, TaskStatus::Running,
                 TaskStatus::Completed, TaskStatus::Failed, TaskStatus::Retry,
                 TaskStatus::Cancelled}) {
    auto parsed = parse_task_status(task_status_name(s));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, s);
  }
}

TEST(TaskTest, TerminalAndBackgroundClassification) {
  EXPECT_TRUE(is_terminal(TaskStatus::Completed));
  EXPECT_TRUE(is_terminal(TaskStatus::Failed));
  EXPECT_TRUE(is_terminal(TaskStatus::Cancelled));
  EXPECT_FALSE(is_terminal(TaskStatus::Retry));
  EXPECT_FALSE(is_terminal(TaskStatus::Running));

  EXPECT_TRUE(is_background(Priority::Low));
  EXPECT_TRUE(is_background(Priority::Batch));
  EXPECT_FALSE(is_background(Priority::Medium));
}

TEST(TaskTest, Score_PriorityDominatesSubmissionTime) {
  auto now = Clock::now();

  EXPECT_LT(compute_score(Priority::Critical, now + 24h),
            compute_score(Priority::High, now));
  EXPECT_LT(compute_score(Priority::Low, now),
            compute_score(Priority::Batch, now - 24h));
}

TEST(TaskTest, Score_EarlierSubmissionWinsWithinPriority) {
  auto now = Clock::now();

  EXPECT_LT(compute_score(Priority::Medium, now),
            compute_score(Priority::Medium, now + 1ms));
}

TEST(TaskTest, Millis_RoundTrip) {
  auto tp = from_millis(1'700'000'000'123);

  EXPECT_EQ(to_millis(tp), 1'700'000'000'123);
}

TEST(TaskEnvelopeTest, EncodeDecode_PreservesFields) {
  auto t = test::make_task("Post to channel", "telegram_post", Priority::Low);
  t.args = nlohmann::json::array({"a", 1});
  t.kwargs = {{"channel", "@StockMarketIndia"}};
  t.max_retries = 2;
  t.retry_count = 1;
  t.timeout = 45s;
  t.scheduled_time = from_millis(to_millis(Clock::now() + 30s));
  t.status = TaskStatus::Retry;
  t.error = "upstream unavailable";

  auto decoded = decode_envelope(encode_envelope(t));

  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->id, t.id);
  EXPECT_EQ(decoded->name, t.name);
  EXPECT_EQ(decoded->function, t.function);
  EXPECT_EQ(decoded->args, t.args);
  EXPECT_EQ(decoded->kwargs, t.kwargs);
  EXPECT_EQ(decoded->priority, Priority::Low);
  EXPECT_EQ(decoded->max_retries, 2);
  EXPECT_EQ(decoded->retry_count, 1);
  EXPECT_EQ(decoded->timeout, 45s);
  ASSERT_TRUE(decoded->scheduled_time.has_value());
  EXPECT_EQ(to_millis(*decoded->scheduled_time), to_millis(*t.scheduled_time));
  EXPECT_EQ(to_millis(decoded->created_at), to_millis(t.created_at));
}

TEST(TaskEnvelopeTest, Encode_CarriesVersion) {
  auto j = nlohmann::json::parse(encode_envelope(test::make_task("v", "f")));

  ASSERT_TRUE(j.contains("version"));
  EXPECT_EQ(j["version"], 1);
}

TEST(TaskEnvelopeTest, Decode_UnknownVersionIsRejected) {
  auto j = nlohmann::json::parse(encode_envelope(test::make_task("v", "f")));
  j["version"] = 99;

  auto decoded = decode_envelope(j.dump());

  ASSERT_FALSE(decoded.has_value());
  EXPECT_EQ(decoded.error(), make_error_code(Error::UnsupportedVersion));
}

TEST(TaskEnvelopeTest, Decode_GarbageIsParseError) {
  auto decoded = decode_envelope("{not json");

  ASSERT_FALSE(decoded.has_value());
  EXPECT_EQ(decoded.error(), make_error_code(Error::ParseError));
}

TEST(TaskEnvelopeTest, Decode_MissingFieldsIsParseError) {
  auto decoded = decode_envelope(R"({"version": 1, "name": "no id"})");

  ASSERT_FALSE(decoded.has_value());
  EXPECT_EQ(decoded.error(), make_error_code(Error::ParseError));
}
