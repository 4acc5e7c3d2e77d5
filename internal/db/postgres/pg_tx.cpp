#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace siros::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool, bool read_only) : read_only_(read_only) {
  conn_ = pool->Acquire();
  if (read_only_) {
    tx_ = std::make_unique<pqxx::read_transaction>(*conn_);
  } else {
    tx_ = std::make_unique<pqxx::work>(*conn_);
  }
}

PgTransaction::~PgTransaction() {
  if (finished_) return;
  try {
    tx_->abort();
  } catch (const std::exception& e) {
    SIROS_LOG_WARN("postgres abort failed", {observability::StringField("error", e.what())});
  }
}

void PgTransaction::Commit() {
  try {
    tx_->commit();
  } catch (const pqxx::serialization_failure& e) {
    finished_ = true;
    throw util::Conflict(e.what());
  } catch (const pqxx::in_doubt_error& e) {
    finished_ = true;
    throw util::PersistenceFailed(std::string("commit outcome unknown: ") + e.what());
  } catch (const pqxx::failure& e) {
    finished_ = true;
    throw util::PersistenceFailed(e.what());
  }
  committed_ = true;
  finished_  = true;
}

void PgTransaction::Rollback() {
  finished_ = true;
  tx_->abort();
}

} // namespace siros::db::postgres
