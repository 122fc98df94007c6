#include "internal/deploy/transaction_manager.hpp"

#include <cassert>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using modeldb::db::ModelStore;
using modeldb::db::Result;
using modeldb::db::Transaction;
using modeldb::db::model::DeployedModelRecord;
using modeldb::db::schema::TableSchema;
using modeldb::deploy::TransactionManager;
using modeldb::util::DeployError;
using modeldb::util::ErrorKind;

struct Counters {
  int begun       = 0;
  int commits     = 0;
  int rollbacks   = 0;
  int destroyed   = 0;
  bool fail_begin    = false;
  bool fail_commit   = false;
  bool fail_rollback = false;
};

class RecordingTransaction final : public Transaction {
 public:
  explicit RecordingTransaction(Counters& counters) : counters_(counters) {
  }

  ~RecordingTransaction() override {
    ++counters_.destroyed;
  }

  void Commit() override {
    ++counters_.commits;
    if (counters_.fail_commit) throw std::runtime_error("could not serialize access");
    committed_ = true;
  }

  void Rollback() override {
    ++counters_.rollbacks;
    if (counters_.fail_rollback) throw std::runtime_error("connection lost");
  }

  bool IsCommitted() const override {
    return committed_;
  }

 private:
  Counters& counters_;
  bool      committed_ = false;
};

class RecordingStore final : public ModelStore {
 public:
  std::unique_ptr<Transaction> Begin() override {
    if (counters.fail_begin) throw std::runtime_error("too many connections");
    ++counters.begun;
    return std::make_unique<RecordingTransaction>(counters);
  }

  Result EnsureTable(Transaction&, const TableSchema&) override {
    return Result::Ok();
  }

  bool TableExists(Transaction&, const std::string&) override {
    return false;
  }

  Result InsertModel(Transaction&, const TableSchema&, DeployedModelRecord&) override {
    return Result::Ok();
  }

  std::optional<DeployedModelRecord> FindModel(Transaction&, const TableSchema&, int64_t) override {
    return std::nullopt;
  }

  int64_t CountModels(Transaction&, const TableSchema&) override {
    return 0;
  }

  Counters counters;
};

DeployError CatchDeployError(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const DeployError& e) {
    return e;
  }
  assert(false && "expected DeployError");
  return DeployError(ErrorKind::kInternal, "unreachable");
}

void TestCommitOnSuccess() {
  RecordingStore     store;
  TransactionManager transactions(store);

  const int value = transactions.WithTransaction([](Transaction&) { return 7; });
  assert(value == 7);
  assert(store.counters.begun == 1);
  assert(store.counters.commits == 1);
  assert(store.counters.rollbacks == 0);
  assert(store.counters.destroyed == 1);

  bool ran = false;
  transactions.WithTransaction([&](Transaction&) { ran = true; });
  assert(ran);
  assert(store.counters.begun == 2);
  assert(store.counters.commits == 2);
  assert(store.counters.destroyed == 2);
}

void TestDeployErrorIsRethrownAfterRollback() {
  RecordingStore     store;
  TransactionManager transactions(store);

  auto e = CatchDeployError([&] {
    transactions.WithTransaction([](Transaction&) { throw DeployError(ErrorKind::kSchemaCreation, "no such schema"); });
  });
  assert(e.kind() == ErrorKind::kSchemaCreation);
  assert(std::string(e.what()) == "no such schema");
  assert(store.counters.commits == 0);
  assert(store.counters.rollbacks == 1);
  assert(store.counters.destroyed == 1);
}

void TestForeignErrorIsWrappedAsInternal() {
  RecordingStore     store;
  TransactionManager transactions(store);

  auto e = CatchDeployError([&] { transactions.WithTransaction([](Transaction&) -> int { throw std::out_of_range("row 3"); }); });
  assert(e.kind() == ErrorKind::kInternal);
  assert(e.cause() != nullptr);
  assert(std::string(e.what()).find("row 3") != std::string::npos);
  assert(store.counters.rollbacks == 1);
  assert(store.counters.commits == 0);
}

void TestFailedRollbackKeepsOriginalError() {
  RecordingStore store;
  store.counters.fail_rollback = true;
  TransactionManager transactions(store);

  auto e = CatchDeployError([&] {
    transactions.WithTransaction([](Transaction&) { throw DeployError(ErrorKind::kSchemaCreation, "create failed"); });
  });
  assert(e.kind() == ErrorKind::kSchemaCreation);
  assert(store.counters.rollbacks == 1);
  assert(store.counters.destroyed == 1);
}

void TestCommitFailureIsCommitError() {
  RecordingStore store;
  store.counters.fail_commit = true;
  TransactionManager transactions(store);

  auto e = CatchDeployError([&] { transactions.WithTransaction([](Transaction&) {}); });
  assert(e.kind() == ErrorKind::kCommit);
  assert(std::string(e.what()).find("could not serialize access") != std::string::npos);
  assert(store.counters.commits == 1);
  assert(store.counters.destroyed == 1);
}

void TestBeginFailureIsInternal() {
  RecordingStore store;
  store.counters.fail_begin = true;
  TransactionManager transactions(store);

  bool ran = false;
  auto e   = CatchDeployError([&] { transactions.WithTransaction([&](Transaction&) { ran = true; }); });
  assert(e.kind() == ErrorKind::kInternal);
  assert(!ran);
  assert(store.counters.begun == 0);
}

} // namespace

int main() {
  TestCommitOnSuccess();
  TestDeployErrorIsRethrownAfterRollback();
  TestForeignErrorIsWrappedAsInternal();
  TestFailedRollbackKeepsOriginalError();
  TestCommitFailureIsCommitError();
  TestBeginFailureIsInternal();

  std::cout << "modeldb_unit_transaction_manager: pass\n";
  return 0;
}
