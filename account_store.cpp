#include "account_store.hpp"

namespace ledger {

AccountStore::AccountStore(const std::vector<AccountBalance>& initial_accounts) {
  for (const auto& entry : initial_accounts) {
    balances_[entry.account_id] = entry.balance;
  }
}

bool AccountStore::contains(AccountId account_id) const {
  return balances_.find(account_id) != balances_.end();
}

std::optional<Amount> AccountStore::balance(AccountId account_id) const {
  auto it = balances_.find(account_id);
  if (it == balances_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void AccountStore::setBalance(AccountId account_id, Amount balance) {
  balances_[account_id] = balance;
}

}  // namespace ledger
