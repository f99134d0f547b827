#include "internal/queue/retry_policy.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace {

using trackq::db::model::QueueItemRecord;
using trackq::queue::FailureClass;
using trackq::queue::RetryOptions;
using trackq::queue::RetryPolicy;

template <typename Error>
std::exception_ptr Raise(const std::string& message) {
  return std::make_exception_ptr(Error(message));
}

void TestClassification() {
  assert(RetryPolicy::Classify(trackq::util::TransientError("timeout")) == FailureClass::Retryable);
  assert(RetryPolicy::Classify(trackq::util::DecryptionError("bad block")) == FailureClass::Retryable);

  assert(RetryPolicy::Classify(trackq::util::AuthError("expired")) == FailureClass::Terminal);
  assert(RetryPolicy::Classify(trackq::util::ContentUnavailable("gone")) == FailureClass::Terminal);
  assert(RetryPolicy::Classify(trackq::util::DiskError("read-only")) == FailureClass::Terminal);
  assert(RetryPolicy::Classify(std::runtime_error("surprise")) == FailureClass::Terminal);

  assert(RetryPolicy::Classify(Raise<trackq::util::TransientError>("timeout")) == FailureClass::Retryable);
  assert(RetryPolicy::Classify(std::make_exception_ptr(42)) == FailureClass::Terminal);
  assert(RetryPolicy::Classify(std::exception_ptr{}) == FailureClass::Terminal);
}

void TestDescribe() {
  assert(RetryPolicy::Describe(Raise<trackq::util::AuthError>("credential expired")) == "credential expired");
  assert(RetryPolicy::Describe(Raise<std::runtime_error>("boom")) == "unexpected error: boom");
  assert(!RetryPolicy::Describe(std::make_exception_ptr(42)).empty());
}

void TestBackoffIsLinearAndCapped() {
  RetryPolicy policy(RetryOptions{.max_retries = 5, .backoff_initial_ms = 2000, .backoff_max_ms = 5000});
  assert(policy.BackoffMs(1) == 2000);
  assert(policy.BackoffMs(2) == 4000);
  assert(policy.BackoffMs(3) == 5000);
  assert(policy.BackoffMs(10) == 5000);
}

void TestRetryableFailureRequeuesUntilExhausted() {
  RetryPolicy     policy;
  QueueItemRecord item;
  item.id     = "t1";
  item.status = trackq::v1::ITEM_STATUS_DOWNLOADING;

  // max_retries = 3: three requeues, then failed with retry_count 3
  for (uint32_t expected = 1; expected <= 3; ++expected) {
    auto decision = policy.Decide(item, FailureClass::Retryable);
    assert(decision.requeue);
    assert(decision.delay_ms == policy.BackoffMs(expected));

    item.error_message = "network timeout";
    policy.Apply(item, decision, "network timeout", 1000);
    assert(item.status == trackq::v1::ITEM_STATUS_PENDING);
    assert(item.retry_count == expected);
    assert(item.error_message.empty());
    assert(item.next_attempt_at_ms == 1000 + decision.delay_ms);
    item.status = trackq::v1::ITEM_STATUS_DOWNLOADING;
  }

  auto decision = policy.Decide(item, FailureClass::Retryable);
  assert(!decision.requeue);
  policy.Apply(item, decision, "network timeout", 2000);
  assert(item.status == trackq::v1::ITEM_STATUS_FAILED);
  assert(item.retry_count == 3);
  assert(item.error_message == "network timeout");
  assert(item.next_attempt_at_ms == 0);
}

void TestTerminalFailureFailsImmediately() {
  RetryPolicy     policy;
  QueueItemRecord item;
  item.status = trackq::v1::ITEM_STATUS_DOWNLOADING;

  auto decision = policy.Decide(item, FailureClass::Terminal);
  assert(!decision.requeue);
  policy.Apply(item, decision, "credential expired", 0);
  assert(item.status == trackq::v1::ITEM_STATUS_FAILED);
  assert(item.retry_count == 0);
  assert(item.error_message == "credential expired");
}

void TestZeroRetriesAndZeroBackoff() {
  RetryPolicy     no_retries(RetryOptions{.max_retries = 0, .backoff_initial_ms = 0, .backoff_max_ms = 0});
  QueueItemRecord item;
  assert(!no_retries.Decide(item, FailureClass::Retryable).requeue);

  RetryPolicy immediate(RetryOptions{.max_retries = 2, .backoff_initial_ms = 0, .backoff_max_ms = 0});
  auto        decision = immediate.Decide(item, FailureClass::Retryable);
  assert(decision.requeue);
  immediate.Apply(item, decision, "timeout", 5000);
  assert(item.next_attempt_at_ms == 0);
}

void TestChildRetries() {
  RetryPolicy policy;
  // attempts counts tries already made: 1 try + 3 retries
  assert(policy.ShouldRetryChild(1, FailureClass::Retryable));
  assert(policy.ShouldRetryChild(3, FailureClass::Retryable));
  assert(!policy.ShouldRetryChild(4, FailureClass::Retryable));
  assert(!policy.ShouldRetryChild(1, FailureClass::Terminal));
}

} // namespace

int main() {
  TestClassification();
  TestDescribe();
  TestBackoffIsLinearAndCapped();
  TestRetryableFailureRequeuesUntilExhausted();
  TestTerminalFailureFailsImmediately();
  TestZeroRetriesAndZeroBackoff();
  TestChildRetries();

  std::cout << "trackq_unit_retry_policy: pass\n";
  return 0;
}
