#include "batch_runner.hpp"

namespace ledger {

codec::SettlementReport runBatch(Ledger& engine, const codec::Batch& batch) {
  codec::SettlementReport report;

  for (const auto& transaction : batch.transactions) {
    StageResult result = engine.StageTransaction(transaction);
    if (!result.ok()) {
      report.rejected.push_back({result.transaction_id, result.status, result.account_id});
    }
  }

  report.settle_status = engine.Settle();
  report.balances = engine.GetBalances();
  report.applied = engine.GetAppliedTransactions();
  return report;
}

codec::SettlementReport runBatch(const codec::Batch& batch) {
  auto engine = CreateLedger(batch.accounts);
  return runBatch(*engine, batch);
}

}  // namespace ledger
