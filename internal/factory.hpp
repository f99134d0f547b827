#pragma once

#include <memory>
#include <vector>

#include "config/config.pb.h"

#include "internal/core/queue_manager.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/notify/notification_bridge.hpp"
#include "internal/pipeline/collaborators.hpp"
#include "internal/queue/queue_store.hpp"
#include "internal/scheduler/download_scheduler.hpp"
#include "internal/service/queue_service.hpp"

#if TRACKQ_WITH_GRPC
#include <grpcpp/grpcpp.h>
#endif

namespace trackq::factory {

// External collaborators of the download pipeline.
struct Collaborators {
  std::shared_ptr<pipeline::CatalogClient> catalog;
  std::shared_ptr<pipeline::StreamFetcher> fetcher;
  std::shared_ptr<pipeline::Decryptor>     decryptor;
  std::shared_ptr<pipeline::Tagger>        tagger;
};

/*
  Application

  Owns every long-lived component of the daemon.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::QueueRepository>          repository;
  std::shared_ptr<notify::NotificationBridge>   bridge;
  std::shared_ptr<queue::QueueStore>            store;
  std::shared_ptr<scheduler::DownloadScheduler> scheduler;
  std::shared_ptr<core::QueueManager>           manager;
  std::shared_ptr<service::QueueService>        queue_service;

#if TRACKQ_WITH_GRPC
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
#endif
};

std::shared_ptr<db::QueueRepository> BuildRepository(const trackq::runtime::config::RuntimeConfig& config);

// Manifest catalog and local-file pipeline named by the config.
Collaborators BuildLocalCollaborators(const trackq::runtime::config::RuntimeConfig& config);

/*
  Build

  Constructs the entire engine from the runtime config. Nothing is started;
  call manager->Start().

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB and pipeline types.
*/
Application Build(const trackq::runtime::config::RuntimeConfig& config);
Application Build(const trackq::runtime::config::RuntimeConfig& config, Collaborators collaborators);

} // namespace trackq::factory
