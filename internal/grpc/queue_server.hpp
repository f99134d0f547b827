#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/queue_service.hpp"
#include "trackq/v1.hpp"

namespace trackq::grpc {

class QueueServer final : public trackq::v1::QueueService::Service {
 public:
  explicit QueueServer(std::shared_ptr<trackq::service::QueueService> svc);

  ::grpc::Status Enqueue(::grpc::ServerContext*, const trackq::v1::EnqueueRequest*, trackq::v1::EnqueueResponse*) override;
  ::grpc::Status Pause(::grpc::ServerContext*, const trackq::v1::ItemRequest*, trackq::v1::ItemResponse*) override;
  ::grpc::Status Resume(::grpc::ServerContext*, const trackq::v1::ItemRequest*, trackq::v1::ItemResponse*) override;
  ::grpc::Status Retry(::grpc::ServerContext*, const trackq::v1::ItemRequest*, trackq::v1::ItemResponse*) override;
  ::grpc::Status Cancel(::grpc::ServerContext*, const trackq::v1::ItemRequest*, trackq::v1::ItemResponse*) override;
  ::grpc::Status Remove(::grpc::ServerContext*, const trackq::v1::ItemRequest*, trackq::v1::RemoveResponse*) override;

  ::grpc::Status Get(::grpc::ServerContext*, const trackq::v1::ItemRequest*, trackq::v1::ItemResponse*) override;
  ::grpc::Status List(::grpc::ServerContext*, const trackq::v1::ListRequest*, trackq::v1::ListResponse*) override;
  ::grpc::Status Stats(::grpc::ServerContext*, const trackq::v1::StatsRequest*, trackq::v1::StatsResponse*) override;
  ::grpc::Status History(::grpc::ServerContext*, const trackq::v1::HistoryRequest*, trackq::v1::HistoryResponse*) override;
  ::grpc::Status FailedTracks(::grpc::ServerContext*, const trackq::v1::ItemRequest*, trackq::v1::FailedTracksResponse*) override;

  ::grpc::Status ClearCompleted(::grpc::ServerContext*, const trackq::v1::ClearRequest*, trackq::v1::ClearResponse*) override;
  ::grpc::Status ClearAll(::grpc::ServerContext*, const trackq::v1::ClearRequest*, trackq::v1::ClearResponse*) override;

  ::grpc::Status Watch(::grpc::ServerContext*, const trackq::v1::WatchRequest*, ::grpc::ServerWriter<trackq::v1::QueueItem>*) override;

 private:
  std::shared_ptr<trackq::service::QueueService> service_;
};

} // namespace trackq::grpc
