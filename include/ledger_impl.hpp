#ifndef LEDGER_LEDGER_IMPL_HPP_
#define LEDGER_LEDGER_IMPL_HPP_

#include "account_store.hpp"
#include "concurrent/guarded.hpp"
#include "ledger.hpp"
#include "observability/metrics.hpp"
#include "staging_area.hpp"

#include <set>
#include <vector>

namespace ledger {

/**
 * In-memory Ledger with two independent reader/writer locks.
 *
 * Lock order is always staging first, then committed state:
 * - StageTransaction holds the staging lock exclusively and reads the
 *   committed balances under a shared lock.
 * - Settle holds both locks exclusively for its whole duration.
 * - GetBalances / GetAppliedTransactions take the committed lock shared.
 */
class LedgerImpl : public Ledger {
 public:
  explicit LedgerImpl(const std::vector<AccountBalance>& initial_accounts,
                      observability::MetricsCollector& metrics =
                          observability::getGlobalMetrics());
  ~LedgerImpl() override = default;

  // Non-copyable
  LedgerImpl(const LedgerImpl&) = delete;
  LedgerImpl& operator=(const LedgerImpl&) = delete;

  StageResult StageTransaction(const Transaction& transaction) override;
  Status Settle() override;
  std::map<AccountId, Amount> GetBalances() const override;
  std::vector<TransactionId> GetAppliedTransactions() const override;

 private:
  struct CommittedState {
    AccountStore accounts;
    std::vector<TransactionId> applied;
  };

  // Union of every account's exclusion set, repeated until no account adds an id.
  static std::set<TransactionId> collectInvalidTransactions(const StagingArea& staging);

  void registerMetrics();

  concurrent::Guarded<StagingArea> staging_;
  concurrent::Guarded<CommittedState> committed_;
  observability::MetricsCollector& metrics_;
};

}  // namespace ledger

#endif  // LEDGER_LEDGER_IMPL_HPP_
