#ifndef LEDGER_ACCOUNT_STORE_HPP_
#define LEDGER_ACCOUNT_STORE_HPP_

#include "transaction.hpp"

#include <map>
#include <optional>
#include <vector>

namespace ledger {

/**
 * Committed, settled balance per account.
 * Not synchronized: the Ledger keeps it inside a Guarded wrapper.
 */
class AccountStore {
 public:
  AccountStore() = default;

  /**
   * Builds the store from an initial balance list.
   * A later entry for the same account id overwrites an earlier one.
   */
  explicit AccountStore(const std::vector<AccountBalance>& initial_accounts);

  bool contains(AccountId account_id) const;

  /**
   * Committed balance of the account, nullopt if it does not exist.
   */
  std::optional<Amount> balance(AccountId account_id) const;

  void setBalance(AccountId account_id, Amount balance);

  const std::map<AccountId, Amount>& balances() const { return balances_; }
  size_t size() const { return balances_.size(); }

 private:
  std::map<AccountId, Amount> balances_;
};

}  // namespace ledger

#endif  // LEDGER_ACCOUNT_STORE_HPP_
