#pragma once

#include <string>
#include <vector>

namespace trackq::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements the executor; RunMigrations decides which steps
  are still missing and applies each one atomically.
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;

  // Highest version recorded in schema_migrations (0 = fresh database).
  virtual int AppliedVersion() = 0;

  virtual void BeginMigration()    = 0;
  virtual void CommitMigration()   = 0;
  virtual void RollbackMigration() = 0;
};

struct Migration {
  int                      version = 0;
  std::string              description;
  std::vector<std::string> statements;
};

// Queue schema, ordered by version.
const std::vector<Migration>& QueueMigrations();

/*
  Runs migrations in order, skipping versions already applied.
  Returns the number of migrations applied.
*/
int RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& ordered);

} // namespace trackq::db::sql
