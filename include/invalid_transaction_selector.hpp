#ifndef LEDGER_INVALID_TRANSACTION_SELECTOR_HPP_
#define LEDGER_INVALID_TRANSACTION_SELECTOR_HPP_

#include "transaction.hpp"

#include <map>
#include <set>

namespace ledger {

/**
 * Decides which transactions must be excluded from one account so that its
 * settled balance is not negative.
 *
 * If initial_balance plus every delta is non-negative nothing is excluded.
 * Otherwise the deltas are walked from the highest transaction id down and
 * each negative one is excluded, until the reconstructed balance is back at
 * or above zero. Positive deltas are never excluded. The scan favours the
 * most recently staged transactions; it does not search for the smallest
 * exclusion set.
 *
 * Pure function: no locking, no logging.
 */
std::set<TransactionId> selectInvalidTransactions(
    Amount initial_balance, const std::map<TransactionId, Amount>& deltas);

}  // namespace ledger

#endif  // LEDGER_INVALID_TRANSACTION_SELECTOR_HPP_
