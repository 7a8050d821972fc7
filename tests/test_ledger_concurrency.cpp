#include "ledger.hpp"
#include "observability/logger.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <iostream>
#include <memory>
#include <sstream>
#include <thread>
#include <vector>

using ledger::Status;
using ledger::Transaction;
using ledger::observability::LogLevel;
using ledger::observability::Logger;

namespace {

ledger::Amount total(const std::map<ledger::AccountId, ledger::Amount>& balances) {
  ledger::Amount sum = 0;
  for (const auto& [_, balance] : balances) sum += balance;
  return sum;
}

// Runs a callback on another thread every time the logger flushes, and
// records whether it finished while the flush was still pending.
class CallbackOnFlushBuffer : public std::stringbuf {
 public:
  ~CallbackOnFlushBuffer() override { joinAll(); }

  void setCallback(std::function<void()> callback) { callback_ = std::move(callback); }

  void joinAll() {
    for (auto& t : workers_) {
      if (t.joinable()) t.join();
    }
    workers_.clear();
  }

  int completed() const { return completed_; }
  int blocked() const { return blocked_; }

 protected:
  int sync() override {
    if (callback_) {
      auto done = std::make_shared<std::promise<void>>();
      auto future = done->get_future();
      workers_.emplace_back([callback = callback_, done]() {
        callback();
        done->set_value();
      });
      if (future.wait_for(std::chrono::seconds(2)) == std::future_status::ready) {
        ++completed_;
      } else {
        ++blocked_;
      }
    }
    return std::stringbuf::sync();
  }

 private:
  std::function<void()> callback_;
  std::vector<std::thread> workers_;
  int completed_ = 0;
  int blocked_ = 0;
};

}  // namespace

class LedgerLoggingTest : public ::testing::Test {
 protected:
  void SetUp() override {
    engine_ = ledger::CreateLedger({{1, 5}, {2, 10}});
    previous_level_ = Logger::getInstance().getLogLevel();
    Logger::getInstance().setLogLevel(LogLevel::INFO);
    Logger::getInstance().setOutputStream(stream_);
  }

  void TearDown() override {
    Logger::getInstance().setOutputStream(std::cout);
    Logger::getInstance().setLogLevel(previous_level_);
    buffer_.joinAll();
  }

  CallbackOnFlushBuffer buffer_;
  std::ostream stream_{&buffer_};
  std::unique_ptr<ledger::Ledger> engine_;
  LogLevel previous_level_ = LogLevel::INFO;
};

TEST_F(LedgerLoggingTest, ReadersAreNotBlockedBySettlementLogging) {
  ASSERT_TRUE(engine_->StageTransaction(Transaction{{{1, 2, 3}}}).ok());

  std::map<ledger::AccountId, ledger::Amount> seen;
  buffer_.setCallback([this, &seen]() { seen = engine_->GetBalances(); });
  ASSERT_EQ(engine_->Settle(), Status::SUCCESS);
  buffer_.joinAll();

  EXPECT_GE(buffer_.completed(), 1);
  EXPECT_EQ(buffer_.blocked(), 0);
  EXPECT_EQ(seen, (std::map<ledger::AccountId, ledger::Amount>{{1, 2}, {2, 13}}));
}

TEST_F(LedgerLoggingTest, StagersAreNotBlockedByRejectionLogging) {
  auto staged = ledger::StageResult::invalidTransaction(0, "callback not run");
  buffer_.setCallback([this, &staged]() {
    staged = engine_->StageTransaction(Transaction{{{1, 2, 1}}});
  });
  EXPECT_FALSE(engine_->StageTransaction(Transaction{}).ok());
  buffer_.joinAll();

  EXPECT_EQ(buffer_.completed(), 1);
  EXPECT_EQ(buffer_.blocked(), 0);
  EXPECT_TRUE(staged.ok());
  EXPECT_EQ(staged.transaction_id, 2);
}

TEST(LedgerConcurrencyTest, ParallelStagingAssignsUniqueIds) {
  const int num_threads = 8;
  const int per_thread = 500;
  auto engine = ledger::CreateLedger({{1, 1000000}, {2, 0}});

  std::vector<std::vector<ledger::TransactionId>> ids(num_threads);
  std::atomic<int> failures{0};
  std::vector<std::thread> workers;

  for (int t = 0; t < num_threads; ++t) {
    workers.emplace_back([&engine, &ids, &failures, t]() {
      for (int i = 0; i < per_thread; ++i) {
        auto result = engine->StageTransaction(Transaction{{{1, 2, 1}}});
        if (!result.ok()) failures.fetch_add(1);
        ids[t].push_back(result.transaction_id);
      }
    });
  }
  for (auto& t : workers) t.join();

  EXPECT_EQ(failures.load(), 0);

  std::vector<ledger::TransactionId> all;
  for (const auto& thread_ids : ids) {
    all.insert(all.end(), thread_ids.begin(), thread_ids.end());
  }
  std::sort(all.begin(), all.end());
  ASSERT_EQ(all.size(), static_cast<size_t>(num_threads * per_thread));
  for (size_t i = 0; i < all.size(); ++i) {
    EXPECT_EQ(all[i], static_cast<ledger::TransactionId>(i + 1));
  }

  ASSERT_EQ(engine->Settle(), Status::SUCCESS);
  EXPECT_EQ(engine->GetAppliedTransactions(), all);
  auto balances = engine->GetBalances();
  EXPECT_EQ(balances[1], 1000000 - num_threads * per_thread);
  EXPECT_EQ(balances[2], num_threads * per_thread);
}

TEST(LedgerConcurrencyTest, ReadersNeverSeePartialSettlement) {
  auto engine = ledger::CreateLedger({{1, 50}, {2, 50}, {3, 50}});
  const ledger::Amount expected_total = 150;

  std::atomic<bool> done{false};
  std::atomic<int> inconsistent{0};
  std::atomic<int> negative{0};

  std::vector<std::thread> readers;
  for (int r = 0; r < 2; ++r) {
    readers.emplace_back([&]() {
      while (!done.load()) {
        auto balances = engine->GetBalances();
        if (total(balances) != expected_total) inconsistent.fetch_add(1);
        for (const auto& [_, balance] : balances) {
          if (balance < 0) negative.fetch_add(1);
        }
        std::this_thread::yield();
      }
    });
  }

  std::vector<std::thread> stagers;
  for (int s = 0; s < 3; ++s) {
    stagers.emplace_back([&engine, s]() {
      for (int i = 0; i < 300; ++i) {
        ledger::AccountId from = (s + i) % 3 + 1;
        ledger::AccountId to = (s + i + 1) % 3 + 1;
        // Large amounts force exclusions as well as successful folds
        auto result = engine->StageTransaction(Transaction{{{from, to, (i % 7) * 10}}});
        EXPECT_TRUE(result.ok());
      }
    });
  }

  std::thread settler([&engine]() {
    for (int i = 0; i < 200; ++i) {
      Status status = engine->Settle();
      EXPECT_TRUE(status == Status::SUCCESS || status == Status::NOTHING_TO_SETTLE);
      std::this_thread::yield();
    }
  });

  for (auto& t : stagers) t.join();
  settler.join();
  Status last = engine->Settle();
  EXPECT_TRUE(last == Status::SUCCESS || last == Status::NOTHING_TO_SETTLE);

  done = true;
  for (auto& t : readers) t.join();

  EXPECT_EQ(inconsistent.load(), 0);
  EXPECT_EQ(negative.load(), 0);
  EXPECT_EQ(total(engine->GetBalances()), expected_total);
}
