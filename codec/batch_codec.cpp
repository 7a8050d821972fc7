#include "codec/batch_codec.hpp"

#include <cstdint>
#include <limits>
#include <sstream>

#include <nlohmann/json.hpp>

namespace ledger {
namespace codec {

namespace {

std::int64_t requireInteger(const nlohmann::json& object, const char* key,
                            const std::string& where) {
  auto it = object.find(key);
  if (it == object.end() || !it->is_number_integer()) {
    throw CodecError(where + ": missing integer field \"" + key + "\"");
  }
  if (it->is_number_unsigned() &&
      it->get<std::uint64_t>() >
          static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
    throw CodecError(where + ": field \"" + key + "\" out of range");
  }
  return it->get<std::int64_t>();
}

AccountId toAccountId(std::int64_t value, const std::string& where) {
  if (value < std::numeric_limits<AccountId>::min() ||
      value > std::numeric_limits<AccountId>::max()) {
    throw CodecError(where + ": account id " + std::to_string(value) + " out of range");
  }
  return static_cast<AccountId>(value);
}

AccountId requireAccountId(const nlohmann::json& object, const char* key,
                           const std::string& where) {
  return toAccountId(requireInteger(object, key, where), where + "." + key);
}

// Bounds-checked reader over the fixture values.
class FixtureReader {
 public:
  explicit FixtureReader(const std::vector<std::int64_t>& values) : values_(values) {}

  std::int64_t next(const char* what) {
    if (pos_ >= values_.size()) {
      throw CodecError(std::string("Fixture truncated while reading ") + what +
                       " at position " + std::to_string(pos_));
    }
    return values_[pos_++];
  }

  AccountId nextAccountId(const char* what) {
    return toAccountId(next(what), std::string("fixture ") + what);
  }

  // Counts are bounded by the number of values left to read.
  size_t nextCount(const char* what) {
    std::int64_t count = next(what);
    if (count < 0) {
      throw CodecError(std::string("Negative ") + what + " in fixture");
    }
    if (static_cast<std::uint64_t>(count) > values_.size()) {
      throw CodecError(std::string("Impossible ") + what + " in fixture");
    }
    return static_cast<size_t>(count);
  }

  bool exhausted() const { return pos_ == values_.size(); }

 private:
  const std::vector<std::int64_t>& values_;
  size_t pos_ = 0;
};

}  // namespace

Batch decodeJsonBatch(const std::string& json_str) {
  nlohmann::json document;
  try {
    document = nlohmann::json::parse(json_str);
  } catch (const nlohmann::json::parse_error& e) {
    throw CodecError(std::string("Invalid JSON batch: ") + e.what());
  }

  if (!document.is_object()) {
    throw CodecError("Batch must be a JSON object");
  }

  Batch batch;

  auto accounts = document.find("accounts");
  if (accounts == document.end() || !accounts->is_array()) {
    throw CodecError("Batch requires an \"accounts\" array");
  }
  for (size_t i = 0; i < accounts->size(); ++i) {
    const auto& entry = (*accounts)[i];
    const std::string where = "accounts[" + std::to_string(i) + "]";
    if (!entry.is_object()) {
      throw CodecError(where + " must be an object");
    }
    batch.accounts.push_back({requireAccountId(entry, "id", where),
                              requireInteger(entry, "balance", where)});
  }

  auto transactions = document.find("transactions");
  if (transactions == document.end()) {
    return batch;
  }
  if (!transactions->is_array()) {
    throw CodecError("\"transactions\" must be an array");
  }
  for (size_t i = 0; i < transactions->size(); ++i) {
    const auto& entry = (*transactions)[i];
    const std::string where = "transactions[" + std::to_string(i) + "]";
    if (!entry.is_object()) {
      throw CodecError(where + " must be an object");
    }

    Transaction transaction;
    auto transfers = entry.find("transfers");
    if (transfers != entry.end()) {
      if (!transfers->is_array()) {
        throw CodecError(where + ".transfers must be an array");
      }
      for (size_t j = 0; j < transfers->size(); ++j) {
        const auto& transfer = (*transfers)[j];
        const std::string transfer_where = where + ".transfers[" + std::to_string(j) + "]";
        if (!transfer.is_object()) {
          throw CodecError(transfer_where + " must be an object");
        }
        transaction.transfers.push_back({requireAccountId(transfer, "from", transfer_where),
                                         requireAccountId(transfer, "to", transfer_where),
                                         requireInteger(transfer, "amount", transfer_where)});
      }
    }
    batch.transactions.push_back(std::move(transaction));
  }

  return batch;
}

std::string encodeJsonReport(const SettlementReport& report) {
  nlohmann::json j;
  j["status"] = statusToString(report.settle_status);

  nlohmann::json balances = nlohmann::json::object();
  for (const auto& [account_id, balance] : report.balances) {
    balances[std::to_string(account_id)] = balance;
  }
  j["balances"] = balances;
  j["applied"] = report.applied;

  nlohmann::json rejected = nlohmann::json::array();
  for (const auto& rejection : report.rejected) {
    nlohmann::json entry;
    entry["transaction_id"] = rejection.transaction_id;
    entry["status"] = statusToString(rejection.status);
    if (rejection.account_id) {
      entry["account_id"] = *rejection.account_id;
    }
    rejected.push_back(entry);
  }
  j["rejected"] = rejected;

  return j.dump();
}

Batch decodeFixture(const std::vector<std::int64_t>& values) {
  FixtureReader reader(values);
  Batch batch;

  for (size_t i = reader.nextCount("account count"); i > 0; --i) {
    AccountBalance account;
    account.account_id = reader.nextAccountId("account id");
    account.balance = reader.next("account balance");
    batch.accounts.push_back(account);
  }

  for (size_t i = reader.nextCount("transaction count"); i > 0; --i) {
    Transaction transaction;
    for (size_t j = reader.nextCount("transfer count"); j > 0; --j) {
      Transfer transfer;
      transfer.from = reader.nextAccountId("transfer source");
      transfer.to = reader.nextAccountId("transfer destination");
      transfer.amount = reader.next("transfer amount");
      transaction.transfers.push_back(transfer);
    }
    batch.transactions.push_back(std::move(transaction));
  }

  if (!reader.exhausted()) {
    throw CodecError("Trailing values after fixture transactions");
  }
  return batch;
}

std::vector<std::int64_t> encodeFixture(const std::vector<AccountBalance>& accounts,
                                        const SettlementReport& report) {
  std::vector<std::int64_t> output;
  output.push_back(static_cast<std::int64_t>(report.balances.size()));
  for (const auto& account : accounts) {
    output.push_back(account.account_id);
    auto it = report.balances.find(account.account_id);
    output.push_back(it == report.balances.end() ? 0 : it->second);
  }

  output.push_back(static_cast<std::int64_t>(report.applied.size()));
  output.insert(output.end(), report.applied.begin(), report.applied.end());
  return output;
}

std::vector<std::int64_t> parseFixtureText(const std::string& text) {
  std::string normalized = text;
  for (char& c : normalized) {
    if (c == ',') c = ' ';
  }

  std::istringstream in(normalized);
  std::vector<std::int64_t> values;
  std::string token;
  while (in >> token) {
    size_t consumed = 0;
    long long value = 0;
    try {
      value = std::stoll(token, &consumed);
    } catch (const std::exception&) {
      throw CodecError("Invalid fixture value: " + token);
    }
    if (consumed != token.size()) {
      throw CodecError("Invalid fixture value: " + token);
    }
    values.push_back(value);
  }
  return values;
}

}  // namespace codec
}  // namespace ledger
