#include "transaction.hpp"

namespace ledger {

std::string statusToString(Status status) {
  switch (status) {
    case Status::SUCCESS: return "SUCCESS";
    case Status::INVALID_TRANSACTION: return "INVALID_TRANSACTION";
    case Status::UNKNOWN_ACCOUNT: return "UNKNOWN_ACCOUNT";
    case Status::NOTHING_TO_SETTLE: return "NOTHING_TO_SETTLE";
    default: return "UNKNOWN";
  }
}

StageResult StageResult::accepted(TransactionId transaction_id) {
  return StageResult{Status::SUCCESS, transaction_id, std::nullopt, "Transaction staged"};
}

StageResult StageResult::invalidTransaction(TransactionId transaction_id,
                                            const std::string& message) {
  return StageResult{Status::INVALID_TRANSACTION, transaction_id, std::nullopt, message};
}

StageResult StageResult::unknownAccount(TransactionId transaction_id, AccountId account_id) {
  return StageResult{Status::UNKNOWN_ACCOUNT, transaction_id, account_id,
                     "Account " + std::to_string(account_id) +
                         " not present, transaction ignored"};
}

}  // namespace ledger
