#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pipeline/local_file_fetcher.hpp"
#include "internal/pipeline/manifest_catalog.hpp"
#include "internal/pipeline/track_downloader.hpp"
#include "internal/queue/retry_policy.hpp"
#include "internal/scheduler/item_executor.hpp"
#if TRACKQ_WITH_GRPC
#include "internal/grpc/queue_server.hpp"
#endif

namespace trackq::factory {

using trackq::runtime::config::RuntimeConfig;

namespace {

std::string QualityName(const RuntimeConfig& config) {
  return trackq::runtime::config::AudioQuality_Name(config.download().quality());
}

} // namespace

std::shared_ptr<db::QueueRepository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    sqlite_db->Migrate();
    TRACKQ_LOG_INFO("sqlite queue store opened", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  }

  TRACKQ_LOG_WARN("using in-memory queue store; queue state is lost on exit");
  return std::make_shared<db::memory::MemoryRepository>();
}

Collaborators BuildLocalCollaborators(const RuntimeConfig& config) {
  const auto& manifest = config.catalog().manifest_path();
  if (manifest.empty()) {
    throw std::runtime_error("catalog.manifest_path is required");
  }

  Collaborators collaborators;
  collaborators.catalog   = std::make_shared<pipeline::ManifestCatalog>(pipeline::ManifestCatalog::LoadFromYaml(manifest));
  collaborators.fetcher   = std::make_shared<pipeline::LocalFileFetcher>();
  collaborators.decryptor = std::make_shared<pipeline::PassthroughDecryptor>();
  collaborators.tagger    = std::make_shared<pipeline::NullTagger>();
  return collaborators;
}

Application Build(const RuntimeConfig& config) {
  return Build(config, BuildLocalCollaborators(config));
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config, Collaborators collaborators) {
  Application app;

  // ------------------------------------------------------------------
  // Persistence + notifications
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  app.bridge     = std::make_shared<notify::NotificationBridge>();

  std::weak_ptr<notify::NotificationBridge> bridge = app.bridge;
  app.store = std::make_shared<queue::QueueStore>(app.repository, util::Now, [bridge](const db::model::QueueItemRecord& item) {
    if (auto target = bridge.lock()) target->Publish(item);
  });

  // ------------------------------------------------------------------
  // Download pipeline
  // ------------------------------------------------------------------
  pipeline::DownloadOptions download_options;
  download_options.chunk_size_bytes = config.download().chunk_size_bytes();
  download_options.quality          = QualityName(config);

  auto downloader = std::make_shared<pipeline::TrackDownloader>(collaborators.fetcher, collaborators.decryptor, collaborators.tagger,
                                                                download_options);

  queue::RetryOptions retry_options;
  retry_options.max_retries        = config.retry().max_retries();
  retry_options.backoff_initial_ms = config.retry().backoff_initial_ms();
  retry_options.backoff_max_ms     = config.retry().backoff_max_ms();

  scheduler::ExecutorOptions executor_options;
  executor_options.output_dir    = config.download().output_dir();
  executor_options.quality       = QualityName(config);
  executor_options.progress_step = config.download().progress_step();

  auto executor = std::make_shared<scheduler::ItemExecutor>(app.store, collaborators.catalog, std::move(downloader),
                                                            queue::RetryPolicy(retry_options), executor_options);

  // ------------------------------------------------------------------
  // Scheduler + control API
  // ------------------------------------------------------------------
  scheduler::SchedulerOptions scheduler_options;
  scheduler_options.workers   = config.download().concurrent_downloads();
  scheduler_options.idle_poll = std::chrono::milliseconds(config.dispatch().idle_poll_ms());

  app.scheduler     = std::make_shared<scheduler::DownloadScheduler>(app.store, std::move(executor), scheduler_options);
  app.manager       = std::make_shared<core::QueueManager>(app.store, app.scheduler, app.bridge);
  app.queue_service = std::make_shared<service::QueueService>(app.manager);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
#if TRACKQ_WITH_GRPC
  app.grpc_services.push_back(std::make_unique<grpc::QueueServer>(app.queue_service));
#endif

  return app;
}

} // namespace trackq::factory
