#include "migrations.hpp"

namespace siros::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }
}

std::vector<std::string> SqliteMigrations(std::uint32_t vector_dimension) {
  const auto vector_bytes = std::to_string(static_cast<std::uint64_t>(vector_dimension) * sizeof(float));
  return {
      "CREATE TABLE IF NOT EXISTS resources (id TEXT PRIMARY KEY, type TEXT NOT NULL, provider TEXT NOT NULL, region TEXT NOT NULL, "
      "name TEXT NOT NULL, data_json TEXT NOT NULL, metadata_json TEXT NOT NULL, parent_id TEXT, children_json TEXT NOT NULL, "
      "links_json TEXT NOT NULL, vector BLOB CHECK (vector IS NULL OR length(vector) = " +
          vector_bytes +
          "), state INTEGER NOT NULL, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, last_scanned_at_ms INTEGER);",
      "CREATE INDEX IF NOT EXISTS idx_resources_provider_type ON resources(provider, type);",
      "CREATE INDEX IF NOT EXISTS idx_resources_region ON resources(region);",
      "CREATE INDEX IF NOT EXISTS idx_resources_parent ON resources(parent_id);",
      "CREATE INDEX IF NOT EXISTS idx_resources_created ON resources(created_at_ms, id);",
      "CREATE TABLE IF NOT EXISTS resource_tags (resource_id TEXT NOT NULL REFERENCES resources(id) ON DELETE CASCADE, key TEXT NOT NULL, "
      "value TEXT NOT NULL, PRIMARY KEY (resource_id, key));",
      "CREATE INDEX IF NOT EXISTS idx_resource_tags_kv ON resource_tags(key, value);",
      "CREATE TABLE IF NOT EXISTS change_records (id TEXT PRIMARY KEY, resource_id TEXT NOT NULL, sequence INTEGER NOT NULL, "
      "operation TEXT NOT NULL, changes_json TEXT NOT NULL, actor TEXT NOT NULL, timestamp_ms INTEGER NOT NULL, previous_hash TEXT NOT NULL, "
      "block_hash TEXT NOT NULL, UNIQUE (resource_id, sequence));",
      "CREATE TRIGGER IF NOT EXISTS change_records_no_update BEFORE UPDATE ON change_records "
      "BEGIN SELECT RAISE(ABORT, 'change records are append-only'); END;",
      "CREATE TRIGGER IF NOT EXISTS change_records_no_delete BEFORE DELETE ON change_records "
      "BEGIN SELECT RAISE(ABORT, 'change records are append-only'); END;",
      "CREATE TABLE IF NOT EXISTS schemas (provider TEXT NOT NULL, type TEXT NOT NULL, name TEXT NOT NULL, version TEXT NOT NULL, "
      "required_fields_json TEXT NOT NULL, description TEXT NOT NULL, created_at_ms INTEGER NOT NULL, PRIMARY KEY (provider, type));",
      "CREATE TABLE IF NOT EXISTS store_settings (key TEXT PRIMARY KEY, value TEXT NOT NULL);",
      std::string("INSERT OR IGNORE INTO store_settings(key, value) VALUES('") + kDimensionSettingKey + "', '" +
          std::to_string(vector_dimension) + "');",
  };
}

std::vector<std::string> PostgresMigrations(std::uint32_t vector_dimension) {
  const auto dim = std::to_string(vector_dimension);
  return {
      "CREATE EXTENSION IF NOT EXISTS vector;",
      "CREATE TABLE IF NOT EXISTS resources (id TEXT PRIMARY KEY, type TEXT NOT NULL, provider TEXT NOT NULL, region TEXT NOT NULL, "
      "name TEXT NOT NULL, data JSONB NOT NULL, metadata JSONB NOT NULL, parent_id TEXT, children JSONB NOT NULL, links JSONB NOT NULL, "
      "embedding vector(" +
          dim +
          "), state SMALLINT NOT NULL, created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL, last_scanned_at_ms BIGINT);",
      "CREATE INDEX IF NOT EXISTS idx_resources_provider_type ON resources(provider, type);",
      "CREATE INDEX IF NOT EXISTS idx_resources_region ON resources(region);",
      "CREATE INDEX IF NOT EXISTS idx_resources_parent ON resources(parent_id);",
      "CREATE INDEX IF NOT EXISTS idx_resources_created ON resources(created_at_ms, id);",
      "CREATE TABLE IF NOT EXISTS resource_tags (resource_id TEXT NOT NULL REFERENCES resources(id) ON DELETE CASCADE, key TEXT NOT NULL, "
      "value TEXT NOT NULL, PRIMARY KEY (resource_id, key));",
      "CREATE INDEX IF NOT EXISTS idx_resource_tags_kv ON resource_tags(key, value);",
      "CREATE TABLE IF NOT EXISTS change_records (id TEXT PRIMARY KEY, resource_id TEXT NOT NULL, sequence BIGINT NOT NULL, "
      "operation TEXT NOT NULL, changes JSONB NOT NULL, actor TEXT NOT NULL, timestamp_ms BIGINT NOT NULL, "
      "previous_hash TEXT NOT NULL, block_hash TEXT NOT NULL, UNIQUE (resource_id, sequence));",
      "CREATE OR REPLACE FUNCTION change_records_append_only() RETURNS trigger AS $$ "
      "BEGIN RAISE EXCEPTION 'change records are append-only'; END; $$ LANGUAGE plpgsql;",
      "DROP TRIGGER IF EXISTS change_records_append_only ON change_records;",
      "CREATE TRIGGER change_records_append_only BEFORE UPDATE OR DELETE ON change_records "
      "FOR EACH ROW EXECUTE FUNCTION change_records_append_only();",
      "CREATE TABLE IF NOT EXISTS schemas (provider TEXT NOT NULL, type TEXT NOT NULL, name TEXT NOT NULL, version TEXT NOT NULL, "
      "required_fields JSONB NOT NULL, description TEXT NOT NULL, created_at_ms BIGINT NOT NULL, PRIMARY KEY (provider, type));",
      "CREATE TABLE IF NOT EXISTS store_settings (key TEXT PRIMARY KEY, value TEXT NOT NULL);",
      std::string("INSERT INTO store_settings(key, value) VALUES('") + kDimensionSettingKey + "', '" + dim + "') ON CONFLICT (key) DO NOTHING;",
  };
}

} // namespace siros::db::sql
