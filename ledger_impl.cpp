#include "ledger_impl.hpp"

#include "invalid_transaction_selector.hpp"
#include "observability/logger.hpp"

#include <chrono>

namespace ledger {

using observability::LogLevel;
using observability::MetricsCollector;

std::unique_ptr<Ledger> CreateLedger(const std::vector<AccountBalance>& initial_accounts) {
  return std::make_unique<LedgerImpl>(initial_accounts);
}

LedgerImpl::LedgerImpl(const std::vector<AccountBalance>& initial_accounts,
                       MetricsCollector& metrics)
    : metrics_(metrics) {
  committed_.write()->accounts = AccountStore(initial_accounts);
  registerMetrics();

  LEDGER_LOG_BUILDER(LogLevel::INFO, "Ledger created")
      .field("accounts", static_cast<int>(initial_accounts.size()));
}

StageResult LedgerImpl::StageTransaction(const Transaction& transaction) {
  StageResult result;
  size_t staged_accounts = 0;
  {
    auto staging = staging_.write();
    auto committed = committed_.read();
    result = staging->stage(transaction, committed->accounts);
    staged_accounts = staging->accountStates().size();
  }

  // Locks are released: logging may block on the output stream
  metrics_.setGauge("ledger_staged_accounts", static_cast<double>(staged_accounts));

  if (!result.ok()) {
    metrics_.incrementCounter("ledger_transactions_rejected_total");
    LEDGER_LOG_BUILDER(LogLevel::WARN, result.message)
        .field("transaction_id", result.transaction_id)
        .field("status", statusToString(result.status));
    return result;
  }

  metrics_.incrementCounter("ledger_transactions_staged_total");
  LEDGER_LOG_BUILDER(LogLevel::DEBUG, "Transaction staged")
      .field("transaction_id", result.transaction_id)
      .field("transfers", static_cast<int>(transaction.transfers.size()));
  return result;
}

Status LedgerImpl::Settle() {
  const auto start = std::chrono::steady_clock::now();
  std::set<TransactionId> invalid;
  std::set<TransactionId> applied;
  size_t settled_accounts = 0;
  {
    // Staging first, then committed state; both held until the fold is complete
    auto staging = staging_.write();
    auto committed = committed_.write();

    settled_accounts = staging->accountStates().size();
    if (settled_accounts > 0) {
      invalid = collectInvalidTransactions(*staging);

      for (const auto& [account_id, state] : staging->accountStates()) {
        Amount final_balance = state.initial_balance;
        for (const auto& [transaction_id, delta] : state.deltas) {
          if (invalid.count(transaction_id) > 0) continue;
          final_balance += delta;
          applied.insert(transaction_id);
        }
        committed->accounts.setBalance(account_id, final_balance);
      }
      committed->applied.assign(applied.begin(), applied.end());
    }

    // Also resets an id counter advanced only by rejected stagings
    staging->clear();
  }

  if (settled_accounts == 0) {
    metrics_.incrementCounter("ledger_settle_empty_total");
    LEDGER_LOG_WARN("Nothing to settle");
    return Status::NOTHING_TO_SETTLE;
  }

  const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now() - start);
  metrics_.observeHistogram("ledger_settle_duration_seconds", elapsed.count() / 1000000.0);
  metrics_.setGauge("ledger_staged_accounts", 0.0);
  metrics_.incrementCounter("ledger_settlements_total");
  metrics_.incrementCounter("ledger_transactions_applied_total",
                            static_cast<double>(applied.size()));
  metrics_.incrementCounter("ledger_transactions_excluded_total",
                            static_cast<double>(invalid.size()));

  for (TransactionId transaction_id : invalid) {
    LEDGER_LOG_BUILDER(LogLevel::DEBUG, "Transaction excluded")
        .field("transaction_id", transaction_id);
  }
  LEDGER_LOG_BUILDER(LogLevel::INFO, "Settlement complete")
      .field("accounts", static_cast<int>(settled_accounts))
      .field("applied", static_cast<int>(applied.size()))
      .field("excluded", static_cast<int>(invalid.size()));
  return Status::SUCCESS;
}

std::map<AccountId, Amount> LedgerImpl::GetBalances() const {
  auto committed = committed_.read();
  return committed->accounts.balances();
}

std::vector<TransactionId> LedgerImpl::GetAppliedTransactions() const {
  auto committed = committed_.read();
  return committed->applied;
}

std::set<TransactionId> LedgerImpl::collectInvalidTransactions(const StagingArea& staging) {
  std::set<TransactionId> invalid;

  // Each round evaluates every account against the previous round's union.
  // A later round only finds something when an excluded transaction was
  // funding another account.
  while (true) {
    std::set<TransactionId> round;
    for (const auto& [account_id, state] : staging.accountStates()) {
      std::map<TransactionId, Amount> remaining;
      for (const auto& [transaction_id, delta] : state.deltas) {
        if (invalid.count(transaction_id) == 0) {
          remaining.emplace(transaction_id, delta);
        }
      }
      const auto selected = selectInvalidTransactions(state.initial_balance, remaining);
      round.insert(selected.begin(), selected.end());
    }

    const size_t before = invalid.size();
    invalid.insert(round.begin(), round.end());
    if (invalid.size() == before) {
      return invalid;
    }
  }
}

void LedgerImpl::registerMetrics() {
  metrics_.describe("ledger_transactions_staged_total", "Transactions accepted into staging");
  metrics_.describe("ledger_transactions_rejected_total", "Transactions rejected at staging");
  metrics_.describe("ledger_transactions_applied_total", "Transactions applied by settlement");
  metrics_.describe("ledger_transactions_excluded_total",
                    "Transactions excluded to keep balances non-negative");
  metrics_.describe("ledger_settlements_total", "Completed settlements");
  metrics_.describe("ledger_settle_empty_total", "Settle calls with nothing staged");
  metrics_.describe("ledger_staged_accounts", "Accounts with tentative state");
  metrics_.describe("ledger_settle_duration_seconds", "Time spent folding staged deltas");
}

}  // namespace ledger
