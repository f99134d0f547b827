#include "retry_policy.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace trackq::queue {

RetryPolicy::RetryPolicy(RetryOptions options) : options_(options) {
}

FailureClass RetryPolicy::Classify(const std::exception& error) {
  if (dynamic_cast<const util::TransientError*>(&error) || dynamic_cast<const util::DecryptionError*>(&error)) {
    return FailureClass::Retryable;
  }
  return FailureClass::Terminal;
}

FailureClass RetryPolicy::Classify(std::exception_ptr error) {
  if (!error) {
    return FailureClass::Terminal;
  }
  try {
    std::rethrow_exception(error);
  } catch (const std::exception& e) {
    return Classify(e);
  } catch (...) {
    return FailureClass::Terminal;
  }
}

std::string RetryPolicy::Describe(std::exception_ptr error) {
  if (!error) {
    return "unknown error";
  }
  try {
    std::rethrow_exception(error);
  } catch (const util::PipelineError& e) {
    return e.what();
  } catch (const std::exception& e) {
    return std::string("unexpected error: ") + e.what();
  } catch (...) {
    return "unexpected non-standard exception";
  }
}

RetryDecision RetryPolicy::Decide(const db::model::QueueItemRecord& item, FailureClass failure) const {
  RetryDecision decision;
  if (failure == FailureClass::Retryable && item.retry_count < options_.max_retries) {
    decision.requeue  = true;
    decision.delay_ms = BackoffMs(item.retry_count + 1);
  }
  return decision;
}

uint64_t RetryPolicy::BackoffMs(uint32_t retry_count) const {
  return std::min<uint64_t>(options_.backoff_initial_ms * retry_count, options_.backoff_max_ms);
}

void RetryPolicy::Apply(db::model::QueueItemRecord& item, const RetryDecision& decision, const std::string& message,
                        uint64_t now_ms) const {
  if (decision.requeue) {
    item.retry_count += 1;
    item.status             = trackq::v1::ITEM_STATUS_PENDING;
    item.next_attempt_at_ms = decision.delay_ms == 0 ? 0 : now_ms + decision.delay_ms;
    item.error_message.clear();
    return;
  }

  item.status             = trackq::v1::ITEM_STATUS_FAILED;
  item.next_attempt_at_ms = 0;
  item.error_message      = message;
}

bool RetryPolicy::ShouldRetryChild(uint32_t attempts, FailureClass failure) const {
  return failure == FailureClass::Retryable && attempts <= options_.max_retries;
}

} // namespace trackq::queue
