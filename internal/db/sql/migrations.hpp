#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace siros::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL().
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

// Runs statements in order. Every statement is idempotent.
void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

/*
  Store layout. The vector dimension is fixed when the store is first
  created; the value is recorded in store_settings and checked on every
  later bootstrap.
*/
std::vector<std::string> SqliteMigrations(std::uint32_t vector_dimension);
std::vector<std::string> PostgresMigrations(std::uint32_t vector_dimension);

inline constexpr const char* kDimensionSettingKey = "vector_dimension";

} // namespace siros::db::sql
