#include "staging_area.hpp"

#include <utility>

namespace ledger {

StageResult StagingArea::stage(const Transaction& transaction, const AccountStore& accounts) {
  const TransactionId transaction_id = ++last_transaction_id_;

  if (transaction.transfers.empty()) {
    return StageResult::invalidTransaction(transaction_id,
                                           "Transaction has no transfers");
  }

  // Whole-transaction rejection: validate every account before touching any state.
  if (auto unknown = findUnknownAccount(transaction, accounts)) {
    return StageResult::unknownAccount(transaction_id, *unknown);
  }

  // Pre-sum the transaction's effect so each account gets one delta per transaction.
  std::map<AccountId, Amount> net;
  for (const auto& transfer : transaction.transfers) {
    net[transfer.from] -= transfer.amount;
    net[transfer.to] += transfer.amount;
  }

  for (const auto& [account_id, delta] : net) {
    stateFor(account_id, accounts).deltas[transaction_id] = delta;
  }
  return StageResult::accepted(transaction_id);
}

void StagingArea::clear() {
  account_states_.clear();
  last_transaction_id_ = 0;
}

std::optional<AccountId> StagingArea::findUnknownAccount(const Transaction& transaction,
                                                         const AccountStore& accounts) const {
  for (const auto& transfer : transaction.transfers) {
    if (!accounts.contains(transfer.from)) {
      return transfer.from;
    }
    if (!accounts.contains(transfer.to)) {
      return transfer.to;
    }
  }
  return std::nullopt;
}

AccountState& StagingArea::stateFor(AccountId account_id, const AccountStore& accounts) {
  auto it = account_states_.find(account_id);
  if (it != account_states_.end()) {
    return it->second;
  }
  AccountState state;
  state.initial_balance = accounts.balance(account_id).value_or(0);
  return account_states_.emplace(account_id, std::move(state)).first->second;
}

}  // namespace ledger
