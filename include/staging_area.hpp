#ifndef LEDGER_STAGING_AREA_HPP_
#define LEDGER_STAGING_AREA_HPP_

#include "account_store.hpp"
#include "transaction.hpp"

#include <map>
#include <optional>
#include <unordered_map>

namespace ledger {

/**
 * Tentative state of one account between two settlements.
 */
struct AccountState {
  // Committed balance at the moment the account was first touched this cycle.
  Amount initial_balance = 0;
  // Net delta per transaction id, ordered by id.
  std::map<TransactionId, Amount> deltas;
};

/**
 * Per-account record of the deltas introduced by staged transactions, plus
 * the transaction id counter. Not synchronized: the Ledger keeps it inside a
 * Guarded wrapper and holds the write lock for a whole staging call.
 */
class StagingArea {
 public:
  StagingArea() = default;

  /**
   * Assigns the next transaction id and records the transaction against
   * every account it touches. The id advances even when the transaction is
   * rejected; a rejected transaction leaves no delta anywhere.
   */
  StageResult stage(const Transaction& transaction, const AccountStore& accounts);

  bool empty() const { return account_states_.empty(); }

  const std::unordered_map<AccountId, AccountState>& accountStates() const {
    return account_states_;
  }

  // Id assigned to the most recent staging call, 0 if none since the last clear.
  TransactionId lastTransactionId() const { return last_transaction_id_; }

  /**
   * Drops every account state and resets the id counter.
   */
  void clear();

 private:
  // First account referenced by `transaction` that is absent from `accounts`.
  std::optional<AccountId> findUnknownAccount(const Transaction& transaction,
                                              const AccountStore& accounts) const;

  AccountState& stateFor(AccountId account_id, const AccountStore& accounts);

  TransactionId last_transaction_id_ = 0;
  std::unordered_map<AccountId, AccountState> account_states_;
};

}  // namespace ledger

#endif  // LEDGER_STAGING_AREA_HPP_
