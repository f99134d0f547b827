#include "internal/db/sql/migrations.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace trackq::db::sql {

const std::vector<Migration>& QueueMigrations() {
  static const std::vector<Migration> kMigrations = {
      {1,
       "queue items and download history",
       {"CREATE TABLE IF NOT EXISTS queue_items ("
        " id TEXT PRIMARY KEY,"
        " type INTEGER NOT NULL,"
        " title TEXT NOT NULL DEFAULT '',"
        " artist TEXT NOT NULL DEFAULT '',"
        " album TEXT NOT NULL DEFAULT '',"
        " status INTEGER NOT NULL,"
        " progress INTEGER NOT NULL DEFAULT 0 CHECK (progress BETWEEN 0 AND 100),"
        " output_path TEXT NOT NULL DEFAULT '',"
        " download_url TEXT NOT NULL DEFAULT '',"
        " error_message TEXT NOT NULL DEFAULT '',"
        " retry_count INTEGER NOT NULL DEFAULT 0,"
        " total_tracks INTEGER NOT NULL DEFAULT 0,"
        " completed_tracks INTEGER NOT NULL DEFAULT 0,"
        " bytes_downloaded INTEGER NOT NULL DEFAULT 0,"
        " total_bytes INTEGER NOT NULL DEFAULT 0,"
        " created_at_ms INTEGER NOT NULL,"
        " updated_at_ms INTEGER NOT NULL,"
        " completed_at_ms INTEGER NOT NULL DEFAULT 0);",
        "CREATE INDEX IF NOT EXISTS idx_queue_items_status ON queue_items(status);",
        "CREATE INDEX IF NOT EXISTS idx_queue_items_created ON queue_items(created_at_ms, id);",
        "CREATE TABLE IF NOT EXISTS download_history ("
        " id INTEGER PRIMARY KEY AUTOINCREMENT,"
        " track_id TEXT NOT NULL,"
        " title TEXT NOT NULL DEFAULT '',"
        " artist TEXT NOT NULL DEFAULT '',"
        " album TEXT NOT NULL DEFAULT '',"
        " file_path TEXT NOT NULL DEFAULT '',"
        " file_size_bytes INTEGER NOT NULL DEFAULT 0,"
        " quality TEXT NOT NULL DEFAULT '',"
        " downloaded_at_ms INTEGER NOT NULL);",
        "CREATE INDEX IF NOT EXISTS idx_download_history_downloaded ON download_history(downloaded_at_ms);"}},
      {2,
       "child tracks of composite items",
       {"CREATE TABLE IF NOT EXISTS child_tracks ("
        " parent_id TEXT NOT NULL REFERENCES queue_items(id) ON DELETE CASCADE,"
        " track_id TEXT NOT NULL,"
        " position INTEGER NOT NULL DEFAULT 0,"
        " title TEXT NOT NULL DEFAULT '',"
        " artist TEXT NOT NULL DEFAULT '',"
        " status INTEGER NOT NULL,"
        " error_message TEXT NOT NULL DEFAULT '',"
        " attempts INTEGER NOT NULL DEFAULT 0,"
        " file_path TEXT NOT NULL DEFAULT '',"
        " file_size_bytes INTEGER NOT NULL DEFAULT 0,"
        " updated_at_ms INTEGER NOT NULL,"
        " PRIMARY KEY (parent_id, track_id));",
        "CREATE INDEX IF NOT EXISTS idx_child_tracks_status ON child_tracks(parent_id, status);"}},
      {3,
       "retry back-off deadline",
       {"ALTER TABLE queue_items ADD COLUMN next_attempt_at_ms INTEGER NOT NULL DEFAULT 0;",
        "CREATE INDEX IF NOT EXISTS idx_queue_items_claim ON queue_items(status, updated_at_ms, created_at_ms);"}},
      {4,
       "transfer rate of running downloads",
       {"ALTER TABLE queue_items ADD COLUMN speed_bytes_per_sec INTEGER NOT NULL DEFAULT 0;",
        "ALTER TABLE queue_items ADD COLUMN eta_seconds INTEGER NOT NULL DEFAULT 0;"}},
  };
  return kMigrations;
}

int RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& ordered) {
  executor.ExecuteSQL(
      "CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, description TEXT NOT NULL DEFAULT '',"
      " applied_at_ms INTEGER NOT NULL);");

  const int current = executor.AppliedVersion();
  int       applied = 0;

  for (const auto& migration : ordered) {
    if (migration.version <= current) continue;

    executor.BeginMigration();
    try {
      for (const auto& statement : migration.statements) {
        executor.ExecuteSQL(statement);
      }
      executor.ExecuteSQL("INSERT INTO schema_migrations(version,description,applied_at_ms) VALUES(" +
                          std::to_string(migration.version) + ",'" + migration.description + "'," +
                          std::to_string(util::ToUnixMillis(util::Now())) + ");");
      executor.CommitMigration();
    } catch (const std::exception& e) {
      executor.RollbackMigration();
      throw std::runtime_error("migration " + std::to_string(migration.version) + " failed: " + e.what());
    }

    TRACKQ_LOG_INFO("schema migration applied", {observability::IntField("version", migration.version),
                                                 observability::StringField("description", migration.description)});
    ++applied;
  }

  return applied;
}

} // namespace trackq::db::sql
