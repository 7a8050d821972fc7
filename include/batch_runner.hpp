#ifndef LEDGER_BATCH_RUNNER_HPP_
#define LEDGER_BATCH_RUNNER_HPP_

#include "codec/batch_codec.hpp"
#include "ledger.hpp"

namespace ledger {

/**
 * Stages every transaction of `batch` against `engine` in order, settles once
 * and collects balances, applied ids and staging rejections.
 */
codec::SettlementReport runBatch(Ledger& engine, const codec::Batch& batch);

/**
 * Same as above on a fresh ledger created from `batch.accounts`.
 */
codec::SettlementReport runBatch(const codec::Batch& batch);

}  // namespace ledger

#endif  // LEDGER_BATCH_RUNNER_HPP_
