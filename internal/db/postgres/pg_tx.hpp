#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace siros::db::postgres {

/*
  Writers run in a pqxx::work, readers in a pqxx::read_transaction.
  Both are exposed through transaction_base so queries are shared.
*/
class PgTransaction final : public db::Transaction {
 public:
  PgTransaction(std::shared_ptr<PgPool> pool, bool read_only);
  ~PgTransaction() override;

  pqxx::transaction_base& Tx() {
    return *tx_;
  }

  bool ReadOnly() const {
    return read_only_;
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

 private:
  std::shared_ptr<pqxx::connection>       conn_;
  std::unique_ptr<pqxx::transaction_base> tx_;
  bool                                    read_only_;
  bool                                    committed_ = false;
  bool                                    finished_  = false;
};

} // namespace siros::db::postgres
