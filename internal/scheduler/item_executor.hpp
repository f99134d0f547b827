#pragma once

#include <cstdint>
#include <exception>
#include <filesystem>
#include <memory>
#include <string>

#include "internal/pipeline/collaborators.hpp"
#include "internal/pipeline/track_downloader.hpp"
#include "internal/queue/queue_store.hpp"
#include "internal/queue/retry_policy.hpp"
#include "item_control.hpp"

namespace trackq::scheduler {

struct ExecutorOptions {
  std::filesystem::path output_dir;
  std::string           quality       = "MP3_320";
  uint32_t              progress_step = 5;
};

enum class ExecutionResult {
  Completed,
  Failed,
  Requeued,  // retryable failure, back to pending
  Stopped,   // paused, cancelled or interrupted by shutdown
  Abandoned, // row removed while executing
};

const char* ToString(ExecutionResult result);

/*
  Runs one claimed item to its next resting state.

  Leaf tracks are downloaded directly. Composite items download their
  children in order, persisting each child and the aggregated parent
  progress after every child; children already completed are skipped on a
  later run.

  Execute() never throws: every failure is classified by the retry policy
  and persisted.

  The write that ends a run seals the item's control. A stop request that
  was accepted before it wins over the outcome of the run (a shutdown only
  over a failure); see Settle().
*/
class ItemExecutor {
 public:
  ItemExecutor(std::shared_ptr<queue::QueueStore> store, std::shared_ptr<pipeline::CatalogClient> catalog,
               std::shared_ptr<pipeline::TrackDownloader> downloader, queue::RetryPolicy retry_policy, ExecutorOptions options);

  ExecutionResult Execute(const db::model::QueueItemRecord& claimed, ItemControl& control);

 private:
  ExecutionResult RunLeaf(const db::model::QueueItemRecord& item, ItemControl& control);
  ExecutionResult RunComposite(const db::model::QueueItemRecord& item, ItemControl& control);

  // Downloads one child, retrying in place. Throws AuthError / DiskError.
  bool DownloadChild(const db::model::QueueItemRecord& parent, const std::filesystem::path& folder,
                     db::model::ChildTrackRecord& child, ItemControl& control);

  ExecutionResult HandleStop(const std::string& id, ItemControl& control);
  ExecutionResult HandleFailure(const std::string& id, ItemControl& control, std::exception_ptr error);

  /*
    Final write of a run. Seals the control inside the write, then applies
    `outcome` unless a request at least as strong as `overridden_by` was
    accepted, in which case that request is applied instead. `applied`
    receives the request that replaced the outcome, or None.
  */
  db::model::QueueItemRecord Settle(const std::string& id, ItemControl& control, StopRequest overridden_by,
                                    const queue::QueueStore::Mutation& outcome, StopRequest& applied);

  void RecordHistory(const db::model::QueueItemRecord& item, const std::string& file_path, uint64_t size_bytes);

  std::shared_ptr<queue::QueueStore>         store_;
  std::shared_ptr<pipeline::CatalogClient>   catalog_;
  std::shared_ptr<pipeline::TrackDownloader> downloader_;
  queue::RetryPolicy                         retry_policy_;
  ExecutorOptions                            options_;
};

} // namespace trackq::scheduler
