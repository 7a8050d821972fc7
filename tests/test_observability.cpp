#include "observability/logger.hpp"
#include "observability/metrics.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <sstream>
#include <stdexcept>

using ledger::observability::LogLevel;
using ledger::observability::Logger;
using ledger::observability::MetricsCollector;

class LoggerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    Logger::getInstance().setOutputStream(output_);
    previous_level_ = Logger::getInstance().getLogLevel();
  }

  void TearDown() override {
    Logger::getInstance().setOutputStream(std::cout);
    Logger::getInstance().setLogLevel(previous_level_);
  }

  std::stringstream output_;
  LogLevel previous_level_ = LogLevel::INFO;
};

TEST_F(LoggerTest, WritesOneJsonObjectPerLine) {
  Logger::getInstance().setLogLevel(LogLevel::INFO);
  Logger::getInstance().info("settled \"batch\"", "settle", "req-7");

  auto entry = nlohmann::json::parse(output_.str());
  EXPECT_EQ(entry["level"], "INFO");
  EXPECT_EQ(entry["message"], "settled \"batch\"");
  EXPECT_EQ(entry["component"], "settle");
  EXPECT_EQ(entry["correlation_id"], "req-7");
  EXPECT_TRUE(entry.contains("timestamp"));
  EXPECT_TRUE(entry.contains("thread"));
}

TEST_F(LoggerTest, BuilderAddsTypedFields) {
  Logger::getInstance().setLogLevel(LogLevel::DEBUG);
  LEDGER_LOG_BUILDER(LogLevel::WARN, "rejected")
      .field("transaction_id", 3)
      .field("status", "UNKNOWN_ACCOUNT")
      .field("ratio", 0.5)
      .field("retry", false);

  auto entry = nlohmann::json::parse(output_.str());
  EXPECT_EQ(entry["level"], "WARN");
  EXPECT_EQ(entry["transaction_id"], 3);
  EXPECT_EQ(entry["status"], "UNKNOWN_ACCOUNT");
  EXPECT_DOUBLE_EQ(entry["ratio"].get<double>(), 0.5);
  EXPECT_EQ(entry["retry"], false);
}

TEST_F(LoggerTest, DropsMessagesBelowMinimumLevel) {
  Logger::getInstance().setLogLevel(LogLevel::ERROR);
  LEDGER_LOG_INFO("hidden");
  LEDGER_LOG_WARN("hidden");
  EXPECT_TRUE(output_.str().empty());

  LEDGER_LOG_ERROR("shown");
  EXPECT_NE(output_.str().find("shown"), std::string::npos);
}

TEST(LogLevelTest, ParsesNamesCaseInsensitively) {
  EXPECT_EQ(ledger::observability::parseLogLevel("debug"), LogLevel::DEBUG);
  EXPECT_EQ(ledger::observability::parseLogLevel("Info"), LogLevel::INFO);
  EXPECT_EQ(ledger::observability::parseLogLevel("warning"), LogLevel::WARN);
  EXPECT_EQ(ledger::observability::parseLogLevel("FATAL"), LogLevel::FATAL);
  EXPECT_THROW(ledger::observability::parseLogLevel("verbose"), std::invalid_argument);
}

TEST(MetricsCollectorTest, CountersAndGauges) {
  MetricsCollector metrics;
  metrics.incrementCounter("ledger_settlements_total");
  metrics.incrementCounter("ledger_settlements_total", 2.0);
  metrics.setGauge("ledger_staged_accounts", 4.0);
  metrics.setGauge("ledger_staged_accounts", 1.0);

  EXPECT_DOUBLE_EQ(metrics.counterValue("ledger_settlements_total"), 3.0);
  EXPECT_DOUBLE_EQ(metrics.gaugeValue("ledger_staged_accounts"), 1.0);
  EXPECT_DOUBLE_EQ(metrics.counterValue("missing"), 0.0);

  metrics.reset();
  EXPECT_DOUBLE_EQ(metrics.counterValue("ledger_settlements_total"), 0.0);
}

TEST(MetricsCollectorTest, ExportsPrometheusText) {
  MetricsCollector metrics;
  metrics.describe("ledger_settlements_total", "Completed settlements");
  metrics.incrementCounter("ledger_settlements_total");
  metrics.observeHistogram("ledger_settle_duration_seconds", 0.00002);
  metrics.observeHistogram("ledger_settle_duration_seconds", 2.0);

  const std::string text = metrics.exportMetrics();
  EXPECT_NE(text.find("# HELP ledger_settlements_total Completed settlements"), std::string::npos);
  EXPECT_NE(text.find("# TYPE ledger_settlements_total counter"), std::string::npos);
  EXPECT_NE(text.find("# TYPE ledger_settle_duration_seconds histogram"), std::string::npos);
  EXPECT_NE(text.find("ledger_settle_duration_seconds_bucket{le=\"5e-05\"} 1"), std::string::npos);
  EXPECT_NE(text.find("ledger_settle_duration_seconds_bucket{le=\"+Inf\"} 2"), std::string::npos);
  EXPECT_NE(text.find("ledger_settle_duration_seconds_count 2"), std::string::npos);
}

TEST(MetricsCollectorTest, ResetForgetsHelpText) {
  MetricsCollector metrics;
  metrics.describe("ledger_settlements_total", "Completed settlements");
  metrics.incrementCounter("ledger_settlements_total");
  metrics.reset();

  metrics.incrementCounter("ledger_settlements_total");
  const std::string text = metrics.exportMetrics();
  EXPECT_EQ(text.find("Completed settlements"), std::string::npos);
  EXPECT_NE(text.find("# HELP ledger_settlements_total Counter metric"), std::string::npos);
}

TEST(MetricsCollectorTest, TimerObservesScope) {
  MetricsCollector metrics;
  {
    MetricsCollector::Timer timer(metrics, "scope_seconds");
  }
  EXPECT_EQ(metrics.histogramCount("scope_seconds"), 1u);
}
