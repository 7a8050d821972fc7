#ifndef LEDGER_BATCH_CODEC_HPP_
#define LEDGER_BATCH_CODEC_HPP_

#include "transaction.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace ledger {
namespace codec {

/**
 * Raised for documents that cannot be turned into a batch.
 */
class CodecError : public std::runtime_error {
 public:
  explicit CodecError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Initial accounts plus the transactions to stage against them, in order.
 */
struct Batch {
  std::vector<AccountBalance> accounts;
  std::vector<Transaction> transactions;
};

// Staging outcome of one rejected transaction.
struct Rejection {
  TransactionId transaction_id;
  Status status;
  std::optional<AccountId> account_id;
};

/**
 * Result of staging a batch and settling it once.
 */
struct SettlementReport {
  Status settle_status = Status::SUCCESS;
  std::map<AccountId, Amount> balances;
  std::vector<TransactionId> applied;
  std::vector<Rejection> rejected;
};

/**
 * JSON batch:
 *   {"accounts": [{"id": 1, "balance": 5}],
 *    "transactions": [{"transfers": [{"from": 1, "to": 2, "amount": 3}]}]}
 * A transaction without "transfers" decodes to an empty transaction.
 * Account ids must fit AccountId and amounts must fit Amount.
 */
Batch decodeJsonBatch(const std::string& json_str);

std::string encodeJsonReport(const SettlementReport& report);

/**
 * Flat integer fixture format:
 *   nAccounts, (id, balance)*, nTx, (nTransfers, (from, to, amount)*)*
 */
Batch decodeFixture(const std::vector<std::int64_t>& values);

/**
 * Fixture output: nAccounts, (id, balance)* in the order of `accounts`,
 * nApplied, applied*.
 */
std::vector<std::int64_t> encodeFixture(const std::vector<AccountBalance>& accounts,
                                        const SettlementReport& report);

// Whitespace or comma separated integers.
std::vector<std::int64_t> parseFixtureText(const std::string& text);

}  // namespace codec
}  // namespace ledger

#endif  // LEDGER_BATCH_CODEC_HPP_
