#include "gtest/gtest.h"
#include "judge/classifier.hpp"
#include "test/worker.hpp"

using namespace std;
using namespace grader;

static execution_outcome environment(outcome::environment_cause cause) {
    return outcome::environment_failure{cause, "boom"};
}

TEST(ClassifierTest, CompletedIsRecordedEvenWithZeroScore) {
    check_set checks = make_check_set({"q1", "q2"});
    classification c = classify(outcome::completed{unreached_results(checks)}, 1, 1);
    EXPECT_EQ(c.action, decision::RECORD);
    EXPECT_EQ(c.status, job_status::DONE);
    EXPECT_EQ(c.fault, fault_kind::NONE);
    EXPECT_EQ(c.reason, "");
}

TEST(ClassifierTest, SubmissionFaultsAreNeverRetried) {
    classification timeout = classify(outcome::timed_out{{}, 3.5}, 1, 5);
    EXPECT_EQ(timeout.action, decision::RECORD);
    EXPECT_EQ(timeout.status, job_status::DONE);
    EXPECT_EQ(timeout.fault, fault_kind::TIMEOUT);
    EXPECT_EQ(timeout.reason, "timed out after 3.5s");

    classification crashed = classify(outcome::submission_crashed{{}, "exited with code 48"}, 1, 5);
    EXPECT_EQ(crashed.action, decision::RECORD);
    EXPECT_EQ(crashed.status, job_status::DONE);
    EXPECT_EQ(crashed.fault, fault_kind::CRASHED);
    EXPECT_EQ(crashed.reason, "crashed: exited with code 48");
}

TEST(ClassifierTest, EnvironmentErrorsAreRetriedUpToLimit) {
    classification first = classify(environment(outcome::environment_cause::RESOURCE_EXHAUSTED), 1, 1);
    EXPECT_EQ(first.action, decision::RETRY);
    EXPECT_EQ(first.status, job_status::RETRYING);
    EXPECT_EQ(first.fault, fault_kind::ENVIRONMENT);

    classification last = classify(environment(outcome::environment_cause::INFRASTRUCTURE), 2, 1);
    EXPECT_EQ(last.action, decision::RECORD);
    EXPECT_EQ(last.status, job_status::FAILED_FATAL);
    EXPECT_EQ(last.fault, fault_kind::ENVIRONMENT);
    EXPECT_EQ(last.reason, "infrastructure failure: boom (gave up after 2 attempts)");

    classification never = classify(environment(outcome::environment_cause::INFRASTRUCTURE), 1, 0);
    EXPECT_EQ(never.action, decision::RECORD);
    EXPECT_EQ(never.status, job_status::FAILED_FATAL);
}

TEST(ClassifierTest, UnavailableImageAbortsBatch) {
    classification c = classify(environment(outcome::environment_cause::IMAGE_UNAVAILABLE), 1, 3);
    EXPECT_EQ(c.action, decision::ABORT);
    EXPECT_EQ(c.status, job_status::FAILED_FATAL);
    EXPECT_EQ(c.fault, fault_kind::ENVIRONMENT);
}

TEST(ClassifierTest, CancelledExecutionIsNotRetried) {
    classification c = classify(environment(outcome::environment_cause::CANCELLED), 1, 3);
    EXPECT_EQ(c.action, decision::RECORD);
    EXPECT_EQ(c.status, job_status::FAILED_FATAL);
    EXPECT_EQ(c.reason, "cancelled: boom");
}

TEST(ClassifierTest, DecisionDisplayMessages) {
    EXPECT_STREQ(get_display_message(decision::RETRY), "retry");
    EXPECT_STREQ(get_display_message(decision::RECORD), "record");
    EXPECT_STREQ(get_display_message(decision::ABORT), "abort");
}
