#include "jobforge/core/error.hpp"
#include "jobforge/orchestrator/job_error.hpp"

#include "gtest/gtest.h"

#include <system_error>

using namespace jobforge;

TEST(ErrorTest, CodesBelongToJobforgeCategory) {
  auto ec = make_error_code(Error::ParseFailed);
  EXPECT_STREQ(ec.category().name(), "jobforge");
  EXPECT_EQ(ec.message(), "malformed response");
  EXPECT_TRUE(static_cast<bool>(ec));
}

TEST(ErrorTest, ImplicitConversionFromEnum) {
  std::error_code ec = Error::ExecutionFailed;
  EXPECT_EQ(ec, make_error_code(Error::ExecutionFailed));
  EXPECT_NE(ec, make_error_code(Error::ParseFailed));
}

TEST(ErrorTest, UnknownValueHasFallbackMessage) {
  std::error_code ec(200, error_category());
  EXPECT_EQ(ec.message(), "unrecognized error");
}

TEST(ErrorTest, CancellationAndTimeoutMatchGenericConditions) {
  EXPECT_EQ(make_error_code(Error::Cancelled),
            std::errc::operation_canceled);
  EXPECT_EQ(make_error_code(Error::Timeout), std::errc::timed_out);
  EXPECT_NE(make_error_code(Error::ExecutionFailed), std::errc::timed_out);
}

TEST(ErrorTest, ResultHelpers) {
  Result<int> good = ok(7);
  ASSERT_TRUE(good.has_value());
  EXPECT_EQ(*good, 7);

  Result<int> bad = fail(Error::NotFound);
  ASSERT_FALSE(bad.has_value());
  EXPECT_EQ(bad.error(), make_error_code(Error::NotFound));

  Result<void> done = ok();
  EXPECT_TRUE(done.has_value());
}

TEST(JobErrorTest, StageNamesRenderAsSnakeCase) {
  EXPECT_EQ(to_string_view(JobErrorStage::Direct), "direct");
  EXPECT_EQ(to_string_view(JobErrorStage::SubTask), "sub_task");
  EXPECT_EQ(to_string_view(JobErrorStage::Aggregate), "aggregate");
  EXPECT_EQ(parse<JobErrorStage>("aggregate"), JobErrorStage::Aggregate);
  EXPECT_EQ(parse<JobErrorStage>("SUB_TASK"), JobErrorStage::SubTask);
  EXPECT_EQ(parse<JobErrorStage>("bogus"), JobErrorStage::Direct);
}

TEST(JobErrorTest, MessageDescribesAbortingSubTask) {
  JobError err{.stage = JobErrorStage::SubTask,
               .code = make_error_code(Error::JobAborted),
               .cause = SubTaskFailure{.index = 2,
                                       .id = SubTaskId{"st-2"},
                                       .name = "summarise",
                                       .error = Error::Timeout,
                                       .attempts = 2,
                                       .cancelled = false}};
  EXPECT_TRUE(err.aborted());
  EXPECT_EQ(err.message(), "sub_task: job aborted (sub-task #2 st-2 "
                           "'summarise' after 2 attempt(s): timeout)");
}

TEST(JobErrorTest, MessageWithoutCause) {
  JobError err{.stage = JobErrorStage::Aggregate,
               .code = make_error_code(Error::AggregationFailed)};
  EXPECT_FALSE(err.aborted());
  EXPECT_EQ(err.message(), "aggregate: aggregation failed");
}
