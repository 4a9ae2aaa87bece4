#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace jobq::db::postgres {

ErrorCode ToErrorCode(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return ErrorCode::AlreadyExists;
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return ErrorCode::ConstraintViolation;
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return ErrorCode::SerializationFailure;
  if (dynamic_cast<const pqxx::deadlock_detected*>(&e)) return ErrorCode::Busy;
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return ErrorCode::IOError;
  return ErrorCode::InternalError;
}

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool)
{
  conn_ = pool->Acquire();
  tx_ = std::make_unique<pqxx::work>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (finished_) {
    return;
  }
  try {
    tx_->abort();
  } catch (const std::exception& e) {
    JOBQ_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
  }
}

void PgTransaction::Commit() {
  finished_ = true;
  try {
    tx_->commit();
  } catch (const pqxx::failure& e) {
    throw util::StoreError(ToErrorCode(e), std::string("commit: ") + e.what());
  }
  committed_ = true;
}

void PgTransaction::Rollback() {
  finished_ = true;
  tx_->abort();
}

}
