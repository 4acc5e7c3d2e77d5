#include "pg_pool.hpp"

namespace siros::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  try {
    auto conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
    return Wrap(conn.release());
  } catch (const std::exception&) {
    std::lock_guard rollback_lock(mutex_);
    --live_connections_;
    cv_.notify_one();
    throw;
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("get_resource",
               "SELECT id,type,provider,region,name,data::text,metadata::text,parent_id,children::text,links::text,embedding::text,state,"
               "created_at_ms,updated_at_ms,last_scanned_at_ms FROM resources WHERE id=$1");

  conn.prepare("insert_resource",
               "INSERT INTO resources(id,type,provider,region,name,data,metadata,parent_id,children,links,embedding,state,created_at_ms,"
               "updated_at_ms,last_scanned_at_ms) VALUES($1,$2,$3,$4,$5,$6::jsonb,$7::jsonb,$8,$9::jsonb,$10::jsonb,$11::vector,$12,$13,$14,$15)");

  conn.prepare("update_resource",
               "UPDATE resources SET type=$2,provider=$3,region=$4,name=$5,data=$6::jsonb,metadata=$7::jsonb,parent_id=$8,children=$9::jsonb,"
               "links=$10::jsonb,embedding=$11::vector,state=$12,created_at_ms=$13,updated_at_ms=$14,last_scanned_at_ms=$15 WHERE id=$1");

  conn.prepare("delete_resource", "DELETE FROM resources WHERE id=$1");

  conn.prepare("list_tags", "SELECT key,value FROM resource_tags WHERE resource_id=$1");
  conn.prepare("delete_tags", "DELETE FROM resource_tags WHERE resource_id=$1");
  conn.prepare("insert_tag", "INSERT INTO resource_tags(resource_id,key,value) VALUES($1,$2,$3)");

  conn.prepare("append_change",
               "INSERT INTO change_records(id,resource_id,sequence,operation,changes,actor,timestamp_ms,previous_hash,block_hash) "
               "VALUES($1,$2,$3,$4,$5::jsonb,$6,$7,$8,$9)");

  conn.prepare("chain_head",
               "SELECT id,resource_id,sequence,operation,changes::text,actor,timestamp_ms,previous_hash,block_hash FROM change_records "
               "WHERE resource_id=$1 ORDER BY sequence DESC LIMIT 1");

  conn.prepare("list_changes",
               "SELECT id,resource_id,sequence,operation,changes::text,actor,timestamp_ms,previous_hash,block_hash FROM change_records "
               "WHERE resource_id=$1 ORDER BY sequence ASC");

  conn.prepare("upsert_schema",
               "INSERT INTO schemas(provider,type,name,version,required_fields,description,created_at_ms) VALUES($1,$2,$3,$4,$5::jsonb,$6,$7) "
               "ON CONFLICT(provider,type) DO UPDATE SET name=EXCLUDED.name,version=EXCLUDED.version,required_fields=EXCLUDED.required_fields,"
               "description=EXCLUDED.description,created_at_ms=EXCLUDED.created_at_ms");

  conn.prepare("get_schema",
               "SELECT provider,type,name,version,required_fields::text,description,created_at_ms FROM schemas WHERE provider=$1 AND type=$2");

  conn.prepare("delete_schema", "DELETE FROM schemas WHERE provider=$1 AND type=$2");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace siros::db::postgres
