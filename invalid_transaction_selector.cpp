#include "invalid_transaction_selector.hpp"

namespace ledger {

std::set<TransactionId> selectInvalidTransactions(
    Amount initial_balance, const std::map<TransactionId, Amount>& deltas) {
  Amount final_balance = initial_balance;
  for (const auto& [_, delta] : deltas) {
    final_balance += delta;
  }

  std::set<TransactionId> invalid;
  if (final_balance >= 0) {
    return invalid;
  }

  Amount balance = final_balance;
  for (auto it = deltas.rbegin(); it != deltas.rend(); ++it) {
    const auto& [transaction_id, delta] = *it;
    if (delta >= 0) continue;

    invalid.insert(transaction_id);
    balance -= delta;
    if (balance >= 0) {
      break;
    }
  }
  return invalid;
}

}  // namespace ledger
