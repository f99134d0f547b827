#include "queue_server.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>

#include "grpc_error.hpp"
#include "internal/observability/logging.hpp"

namespace trackq::grpc {

using namespace trackq::v1;

namespace {

constexpr auto kWatchPoll = std::chrono::milliseconds(250);

// Snapshots handed from the notification thread to one Watch stream.
struct WatchQueue {
  std::mutex              mutex;
  std::condition_variable cv;
  std::deque<QueueItem>   items;
};

template <typename Fn>
::grpc::Status Call(Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace

QueueServer::QueueServer(std::shared_ptr<trackq::service::QueueService> svc) : service_(std::move(svc)) {
}

::grpc::Status QueueServer::Enqueue(::grpc::ServerContext*, const EnqueueRequest* req, EnqueueResponse* resp) {
  return Call([&] { *resp = service_->Enqueue(*req); });
}

::grpc::Status QueueServer::Pause(::grpc::ServerContext*, const ItemRequest* req, ItemResponse* resp) {
  return Call([&] { *resp = service_->Pause(*req); });
}

::grpc::Status QueueServer::Resume(::grpc::ServerContext*, const ItemRequest* req, ItemResponse* resp) {
  return Call([&] { *resp = service_->Resume(*req); });
}

::grpc::Status QueueServer::Retry(::grpc::ServerContext*, const ItemRequest* req, ItemResponse* resp) {
  return Call([&] { *resp = service_->Retry(*req); });
}

::grpc::Status QueueServer::Cancel(::grpc::ServerContext*, const ItemRequest* req, ItemResponse* resp) {
  return Call([&] { *resp = service_->Cancel(*req); });
}

::grpc::Status QueueServer::Remove(::grpc::ServerContext*, const ItemRequest* req, RemoveResponse* resp) {
  return Call([&] { *resp = service_->Remove(*req); });
}

::grpc::Status QueueServer::Get(::grpc::ServerContext*, const ItemRequest* req, ItemResponse* resp) {
  return Call([&] { *resp = service_->Get(*req); });
}

::grpc::Status QueueServer::List(::grpc::ServerContext*, const ListRequest* req, ListResponse* resp) {
  return Call([&] { *resp = service_->List(*req); });
}

::grpc::Status QueueServer::Stats(::grpc::ServerContext*, const StatsRequest* req, StatsResponse* resp) {
  return Call([&] { *resp = service_->Stats(*req); });
}

::grpc::Status QueueServer::History(::grpc::ServerContext*, const HistoryRequest* req, HistoryResponse* resp) {
  return Call([&] { *resp = service_->History(*req); });
}

::grpc::Status QueueServer::FailedTracks(::grpc::ServerContext*, const ItemRequest* req, FailedTracksResponse* resp) {
  return Call([&] { *resp = service_->FailedTracks(*req); });
}

::grpc::Status QueueServer::ClearCompleted(::grpc::ServerContext*, const ClearRequest* req, ClearResponse* resp) {
  return Call([&] { *resp = service_->ClearCompleted(*req); });
}

::grpc::Status QueueServer::ClearAll(::grpc::ServerContext*, const ClearRequest* req, ClearResponse* resp) {
  return Call([&] { *resp = service_->ClearAll(*req); });
}

::grpc::Status QueueServer::Watch(::grpc::ServerContext* ctx, const WatchRequest*, ::grpc::ServerWriter<QueueItem>* writer) {
  // the listener may fire once after Unwatch, so it shares ownership
  auto queue = std::make_shared<WatchQueue>();

  notify::NotificationBridge::SubscriptionId subscription = 0;
  try {
    subscription = service_->Watch([queue](const QueueItem& item) {
      {
        std::lock_guard lock(queue->mutex);
        queue->items.push_back(item);
      }
      queue->cv.notify_one();
    });
  } catch (const std::exception& e) {
    return ToStatus(e);
  }

  TRACKQ_LOG_DEBUG("watch stream opened", {observability::IntField("subscription", static_cast<int64_t>(subscription))});

  // ends when the client goes away or server shutdown cancels the call
  while (!ctx->IsCancelled()) {
    std::deque<QueueItem> batch;
    {
      std::unique_lock lock(queue->mutex);
      queue->cv.wait_for(lock, kWatchPoll, [&] { return !queue->items.empty(); });
      batch.swap(queue->items);
    }

    bool open = true;
    for (const auto& item : batch) {
      if (!writer->Write(item)) {
        open = false;
        break;
      }
    }
    if (!open) break;
  }

  service_->Unwatch(subscription);
  TRACKQ_LOG_DEBUG("watch stream closed", {observability::IntField("subscription", static_cast<int64_t>(subscription))});
  return ::grpc::Status::OK;
}

} // namespace trackq::grpc
