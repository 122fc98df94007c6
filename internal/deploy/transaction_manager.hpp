#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

#include "internal/db/api/model_store.hpp"
#include "internal/db/api/transaction.hpp"

namespace modeldb::deploy {

/*
  Scoped transaction around a unit of work.

  Per call exactly one transaction is opened and exactly one of
  commit / rollback happens:

    unit returns              -> Commit(); failure raises kCommit
    unit throws DeployError   -> Rollback(), same error rethrown
    unit throws anything else -> Rollback(), kInternal wrapping the cause

  The transaction (and with it the connection) is released on every path.
*/
class TransactionManager {
 public:
  explicit TransactionManager(db::ModelStore& store);

  template <typename UnitOfWork>
  std::invoke_result_t<UnitOfWork&, db::Transaction&> WithTransaction(UnitOfWork&& unit_of_work);

 private:
  std::unique_ptr<db::Transaction> Open();

  static void Run(db::Transaction& tx, const std::function<void()>& body);
  static void Commit(db::Transaction& tx);
  static void RollbackAfterFailure(db::Transaction& tx) noexcept;

  db::ModelStore& store_;
};

template <typename UnitOfWork>
std::invoke_result_t<UnitOfWork&, db::Transaction&> TransactionManager::WithTransaction(UnitOfWork&& unit_of_work) {
  using ResultType = std::invoke_result_t<UnitOfWork&, db::Transaction&>;

  std::unique_ptr<db::Transaction> tx = Open();

  if constexpr (std::is_void_v<ResultType>) {
    Run(*tx, [&] { unit_of_work(*tx); });
    Commit(*tx);
  } else {
    std::optional<ResultType> result;
    Run(*tx, [&] { result.emplace(unit_of_work(*tx)); });
    Commit(*tx);
    return std::move(*result);
  }
}

} // namespace modeldb::deploy
