#ifndef LEDGER_LEDGER_HPP_
#define LEDGER_LEDGER_HPP_

#include "transaction.hpp"

#include <map>
#include <memory>
#include <vector>

namespace ledger {

/**
 * Abstract base class for the two-phase ledger.
 * Transactions are staged one at a time and folded into the committed
 * balances by Settle, which drops whatever would leave a balance negative.
 */
class Ledger {
 public:
  virtual ~Ledger() = default;

  /**
   * Stages `transaction` under the next transaction id.
   * Fails with INVALID_TRANSACTION for an empty transfer list and with
   * UNKNOWN_ACCOUNT when any transfer references a missing account; in both
   * cases nothing is staged.
   */
  virtual StageResult StageTransaction(const Transaction& transaction) = 0;

  /**
   * Folds every staged delta that survives validation into the committed
   * balances, then clears the staging state.
   * Returns NOTHING_TO_SETTLE when nothing was staged since the last call.
   */
  virtual Status Settle() = 0;

  /**
   * Committed balance per account as of the last completed settlement.
   */
  virtual std::map<AccountId, Amount> GetBalances() const = 0;

  /**
   * Ids applied by the most recent settlement, ascending.
   */
  virtual std::vector<TransactionId> GetAppliedTransactions() const = 0;
};

/**
 * Creates a thread-safe ledger holding `initial_accounts`.
 * A later entry for the same account id overwrites an earlier one.
 */
std::unique_ptr<Ledger> CreateLedger(const std::vector<AccountBalance>& initial_accounts);

}  // namespace ledger

#endif  // LEDGER_LEDGER_HPP_
