#include "batch_runner.hpp"
#include "codec/batch_codec.hpp"
#include "ledger_config.hpp"
#include "observability/logger.hpp"
#include "observability/metrics.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace {

std::string readFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("Cannot open batch file: " + path);
  }
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

}  // namespace

int main(int argc, char* argv[]) {
  ledger::LedgerConfig config;
  try {
    config = ledger::parseArgs(argc, argv);
  } catch (const std::invalid_argument& e) {
    std::cerr << e.what() << "\n" << ledger::usage(argv[0]) << std::endl;
    return 1;
  }

  auto& logger = ledger::observability::Logger::getInstance();
  logger.setOutputStream(std::cerr);
  logger.setLogLevel(config.log_level);

  auto& metrics = ledger::observability::getGlobalMetrics();
  metrics.describe("ledger_batch_duration_seconds", "Time to decode, stage and settle the batch");

  // The batch file names every log line of this run
  const std::string& correlation_id = config.batch_file;

  try {
    ledger::observability::MetricsCollector::Timer timer(metrics, "ledger_batch_duration_seconds");
    const std::string contents = readFile(config.batch_file);

    if (config.format == ledger::BatchFormat::JSON) {
      auto batch = ledger::codec::decodeJsonBatch(contents);
      auto report = ledger::runBatch(batch);
      logger.info("Batch settled: " + ledger::statusToString(report.settle_status), "main",
                  correlation_id);
      std::cout << ledger::codec::encodeJsonReport(report) << std::endl;
    } else {
      auto batch = ledger::codec::decodeFixture(ledger::codec::parseFixtureText(contents));
      auto report = ledger::runBatch(batch);
      logger.info("Batch settled: " + ledger::statusToString(report.settle_status), "main",
                  correlation_id);
      const auto output = ledger::codec::encodeFixture(batch.accounts, report);
      for (size_t i = 0; i < output.size(); ++i) {
        std::cout << (i == 0 ? "" : " ") << output[i];
      }
      std::cout << std::endl;
    }
  } catch (const ledger::codec::CodecError& e) {
    logger.error(std::string("Malformed batch: ") + e.what(), "main", correlation_id);
    return 1;
  } catch (const std::exception& e) {
    logger.error(e.what(), "main", correlation_id);
    return 1;
  }

  if (config.dump_metrics) {
    std::cerr << metrics.exportMetrics();
  }
  return 0;
}
