#include "ledger_config.hpp"

#include <stdexcept>

namespace ledger {

LedgerConfig parseArgs(int argc, const char* const argv[]) {
  LedgerConfig config;

  if (argc < 2) {
    throw std::invalid_argument("Missing batch file");
  }
  config.batch_file = argv[1];
  if (argc >= 3) config.log_level = observability::parseLogLevel(argv[2]);
  if (argc >= 4) {
    const std::string format = argv[3];
    if (format == "json") {
      config.format = BatchFormat::JSON;
    } else if (format == "fixture") {
      config.format = BatchFormat::FIXTURE;
    } else {
      throw std::invalid_argument("Unknown batch format: " + format);
    }
  }
  if (argc >= 5) {
    const std::string flag = argv[4];
    if (flag != "metrics") {
      throw std::invalid_argument("Unknown option: " + flag);
    }
    config.dump_metrics = true;
  }
  if (argc > 5) {
    throw std::invalid_argument("Too many arguments");
  }
  return config;
}

std::string usage(const std::string& program) {
  return "Usage: " + program + " <batch_file> [log_level] [json|fixture] [metrics]";
}

}  // namespace ledger
