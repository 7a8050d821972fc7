#ifndef LEDGER_LEDGER_CONFIG_HPP_
#define LEDGER_LEDGER_CONFIG_HPP_

#include "observability/logger.hpp"

#include <string>

namespace ledger {

enum class BatchFormat {
  JSON,
  FIXTURE
};

/**
 * Command line configuration of ledger_cli.
 *   ledger_cli <batch_file> [log_level] [json|fixture] [metrics]
 */
struct LedgerConfig {
  std::string batch_file;
  observability::LogLevel log_level = observability::LogLevel::WARN;
  BatchFormat format = BatchFormat::JSON;
  bool dump_metrics = false;
};

/**
 * Parses positional arguments. Throws std::invalid_argument when the batch
 * file is missing or a value is not recognised.
 */
LedgerConfig parseArgs(int argc, const char* const argv[]);

std::string usage(const std::string& program);

}  // namespace ledger

#endif  // LEDGER_LEDGER_CONFIG_HPP_
