// (c) 2024, Interance GmbH & Co KG.

#include "stockpile/transaction_scope.hpp"

#include "stockpile/ec.hpp"
#include "stockpile/log.hpp"

namespace stockpile {

namespace {

// Removes the deadline of a connection when leaving the scope.
class deadline_guard {
public:
  deadline_guard(database& db, std::optional<caf::timestamp> deadline)
    : db_(db) {
    db_.set_deadline(deadline);
  }

  deadline_guard(const deadline_guard&) = delete;

  deadline_guard& operator=(const deadline_guard&) = delete;

  ~deadline_guard() {
    db_.set_deadline(std::nullopt);
  }

private:
  database& db_;
};

} // namespace

caf::error transaction_scope::execute(const work& fn) {
  return run(std::nullopt, fn);
}

caf::error transaction_scope::execute(caf::timespan timeout, const work& fn) {
  return run(caf::make_timestamp() + timeout, fn);
}

caf::error transaction_scope::run(std::optional<caf::timestamp> deadline,
                                  const work& fn) {
  if (db_->in_transaction())
    return caf::make_error(ec::invalid_argument,
                           "nested transactions are not supported");
  auto err = caf::error{};
  {
    deadline_guard guard{*db_, deadline};
    if (auto begin_err = db_->begin())
      return begin_err;
    inventory_item_store items{*db_};
    stock_lock_store locks{*db_};
    stock_batch_store batches{*db_};
    stock_ledger ledger{*db_};
    transactional_stores stores{items, locks, batches, ledger};
    err = fn(stores);
  }
  // The deadline is gone at this point, so neither ROLLBACK nor COMMIT get
  // interrupted.
  if (!err && deadline && caf::make_timestamp() >= *deadline)
    err = caf::make_error(ec::deadline_exceeded,
                          "transaction ran past its deadline");
  if (err) {
    if (auto rollback_err = db_->rollback())
      log::error("failed to roll back a transaction: {}",
                 to_string(rollback_err));
    log::debug("rolled back a transaction: {}", to_string(err));
    return err;
  }
  if (auto commit_err = db_->commit()) {
    if (auto rollback_err = db_->rollback())
      log::error("failed to roll back a transaction: {}",
                 to_string(rollback_err));
    return commit_err;
  }
  return caf::error{};
}

} // namespace stockpile
