#pragma once

#include <cstdint>
#include <exception>
#include <string>

#include "internal/db/model/queue_item_record.hpp"

namespace trackq::queue {

enum class FailureClass {
  Retryable, // transient network / decryption failure
  Terminal,  // auth, unavailable content, disk, anything unclassified
};

struct RetryOptions {
  uint32_t max_retries        = 3;
  uint64_t backoff_initial_ms = 2000;
  uint64_t backoff_max_ms     = 30000;
};

struct RetryDecision {
  bool     requeue  = false;
  uint64_t delay_ms = 0;
};

/*
  Decides the fate of a failed item.

  A retryable failure with retry_count < max_retries requeues the item at the
  back of the queue; anything else fails it. With max_retries = 3 an item is
  attempted four times and ends failed with retry_count = 3.
*/
class RetryPolicy {
 public:
  explicit RetryPolicy(RetryOptions options = {});

  static FailureClass Classify(const std::exception& error);
  static FailureClass Classify(std::exception_ptr error);

  // Message persisted with the failure.
  static std::string Describe(std::exception_ptr error);

  RetryDecision Decide(const db::model::QueueItemRecord& item, FailureClass failure) const;

  // min(backoff_initial_ms * retry_count, backoff_max_ms)
  uint64_t BackoffMs(uint32_t retry_count) const;

  /*
    Applies a decision to the item: either back to pending with retry_count
    incremented and the error cleared, or failed with `message`.
  */
  void Apply(db::model::QueueItemRecord& item, const RetryDecision& decision, const std::string& message, uint64_t now_ms) const;

  // Child tracks retry in place; `attempts` counts tries already made.
  bool ShouldRetryChild(uint32_t attempts, FailureClass failure) const;

  const RetryOptions& Options() const {
    return options_;
  }

 private:
  RetryOptions options_;
};

} // namespace trackq::queue
