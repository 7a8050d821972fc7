#ifndef LEDGER_TRANSACTION_HPP_
#define LEDGER_TRANSACTION_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ledger {

using AccountId = int;
using TransactionId = int;
// Smallest currency unit. Signed: deltas and initial balances may be negative.
using Amount = std::int64_t;

/**
 * Movement of `amount` from one account to another.
 */
struct Transfer {
  AccountId from;
  AccountId to;
  Amount amount;
};

/**
 * Ordered set of transfers submitted together. Either every transfer is
 * applied at settlement or none is.
 */
struct Transaction {
  std::vector<Transfer> transfers;
};

// Entry of the initial balance list given at construction.
struct AccountBalance {
  AccountId account_id;
  Amount balance;
};

enum class Status {
  SUCCESS,
  INVALID_TRANSACTION,
  UNKNOWN_ACCOUNT,
  NOTHING_TO_SETTLE
};

std::string statusToString(Status status);

/**
 * Outcome of staging one transaction. `transaction_id` is always set because
 * the id counter advances even when staging is rejected.
 */
struct StageResult {
  Status status;
  TransactionId transaction_id;
  std::optional<AccountId> account_id;  // only for UNKNOWN_ACCOUNT
  std::string message;

  bool ok() const { return status == Status::SUCCESS; }

  static StageResult accepted(TransactionId transaction_id);
  static StageResult invalidTransaction(TransactionId transaction_id,
                                        const std::string& message);
  static StageResult unknownAccount(TransactionId transaction_id, AccountId account_id);
};

}  // namespace ledger

#endif  // LEDGER_TRANSACTION_HPP_
