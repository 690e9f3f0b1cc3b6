#include <gtest/gtest.h>

#include "application/LedgerAuditor.hpp"
#include "application/LedgerEngine.hpp"
#include "application/TransferOrchestrator.hpp"
#include "domain/LedgerErrors.hpp"
#include "mocks/RecordingAccountStore.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace corebank;
using namespace corebank::domain;
using corebank::application::LedgerAuditor;
using corebank::application::LedgerEngine;
using corebank::application::TransferOrchestrator;
using corebank::tests::RecordingAccountStore;

// ============================================================================
// Test Fixture
// ============================================================================

class TransferOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<RecordingAccountStore>();
        engine_ = std::make_shared<LedgerEngine>(store_);
        orchestrator_ = std::make_shared<TransferOrchestrator>(engine_);
    }

    void openAccount(const std::string& id, const std::string& number, const std::string& deposit) {
        store_->createAccount(Account(id, number, "user-1", AccountType::CHECKING));
        if (Decimal::parse(deposit).isPositive()) {
            engine_->deposit(id, Decimal::parse(deposit), "Initial");
        }
    }

    Decimal balanceOf(const std::string& accountId) {
        return store_->findAccountById(accountId)->balance;
    }

    std::shared_ptr<RecordingAccountStore> store_;
    std::shared_ptr<LedgerEngine> engine_;
    std::shared_ptr<TransferOrchestrator> orchestrator_;
};

// ============================================================================
// ТЕСТЫ: атомарность
// ============================================================================

TEST_F(TransferOrchestratorTest, Transfer_MovesMoneyInOneGroup) {
    openAccount("A", "ACC000000000001", "100.00");
    openAccount("B", "ACC000000000002", "50.00");
    auto groupsBefore = store_->findAllTransactionGroups().size();

    auto [out, in] = orchestrator_->transfer("A", "B", Decimal::parse("30.00"), "");

    EXPECT_EQ(balanceOf("A").toString(), "70.0000");
    EXPECT_EQ(balanceOf("B").toString(), "80.0000");
    EXPECT_EQ(out.groupId, in.groupId);
    EXPECT_EQ(out.entryType, EntryType::DEBIT);
    EXPECT_EQ(in.entryType, EntryType::CREDIT);
    EXPECT_EQ(out.relatedAccountId.value(), "B");
    EXPECT_EQ(in.relatedAccountId.value(), "A");
    EXPECT_EQ(out.balanceAfter.toString(), "70.0000");
    EXPECT_EQ(in.balanceAfter.toString(), "80.0000");

    EXPECT_EQ(store_->findAllTransactionGroups().size(), groupsBefore + 1);
    auto entries = store_->findEntriesByGroupId(out.groupId);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].amount, entries[1].amount);
}

TEST_F(TransferOrchestratorTest, Transfer_SameAccountRejected) {
    openAccount("A", "ACC000000000001", "100.00");

    EXPECT_THROW(orchestrator_->transfer("A", "A", Decimal::fromInt(1), ""), BusinessRuleException);
    EXPECT_EQ(balanceOf("A").toString(), "100.0000");
}

TEST_F(TransferOrchestratorTest, Transfer_InsufficientFundsLeavesBothUnchanged) {
    openAccount("A", "ACC000000000001", "10.00");
    openAccount("B", "ACC000000000002", "0");

    EXPECT_THROW(orchestrator_->transfer("A", "B", Decimal::parse("10.01"), ""), InsufficientFundsException);
    EXPECT_EQ(balanceOf("A").toString(), "10.0000");
    EXPECT_TRUE(balanceOf("B").isZero());
}

// ============================================================================
// ТЕСТЫ: порядок блокировок
// ============================================================================

TEST_F(TransferOrchestratorTest, LockOrder_SortedRegardlessOfDirection) {
    openAccount("acc-b", "ACC000000000001", "100.00");
    openAccount("acc-a", "ACC000000000002", "100.00");

    orchestrator_->transfer("acc-b", "acc-a", Decimal::fromInt(5), "b to a");
    auto forward = store_->lockSequences().back();

    orchestrator_->transfer("acc-a", "acc-b", Decimal::fromInt(5), "a to b");
    auto backward = store_->lockSequences().back();

    std::vector<std::string> expected{"acc-a", "acc-b"};
    EXPECT_EQ(forward, expected);
    EXPECT_EQ(backward, expected);
}

TEST_F(TransferOrchestratorTest, LockOrder_FailedTransferStillSorted) {
    openAccount("z-acc", "ACC000000000001", "1.00");
    openAccount("m-acc", "ACC000000000002", "0");

    EXPECT_THROW(orchestrator_->transfer("z-acc", "m-acc", Decimal::fromInt(5), ""), InsufficientFundsException);

    std::vector<std::string> expected{"m-acc", "z-acc"};
    EXPECT_EQ(store_->lockSequences().back(), expected);
}

// ============================================================================
// ТЕСТЫ: конкурентность
// ============================================================================

TEST_F(TransferOrchestratorTest, Concurrent_OppositeTransfersTerminate) {
    openAccount("A", "ACC000000000001", "1000.00");
    openAccount("B", "ACC000000000002", "1000.00");

    constexpr int iterations = 200;
    std::atomic<int> completed{0};

    std::thread forward([&]() {
        for (int i = 0; i < iterations; ++i) {
            orchestrator_->transfer("A", "B", Decimal::fromInt(1), "");
            ++completed;
        }
    });
    std::thread backward([&]() {
        for (int i = 0; i < iterations; ++i) {
            orchestrator_->transfer("B", "A", Decimal::fromInt(1), "");
            ++completed;
        }
    });
    forward.join();
    backward.join();

    EXPECT_EQ(completed.load(), 2 * iterations);
    EXPECT_EQ(balanceOf("A").toString(), "1000.0000");
    EXPECT_EQ(balanceOf("B").toString(), "1000.0000");
}

TEST_F(TransferOrchestratorTest, Concurrent_ConservationAndNonNegativity) {
    const std::vector<std::string> accounts{"A", "B", "C", "D"};
    openAccount("A", "ACC000000000001", "100.00");
    openAccount("B", "ACC000000000002", "100.00");
    openAccount("C", "ACC000000000003", "100.00");
    openAccount("D", "ACC000000000004", "100.00");

    std::atomic<int> rejected{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&, t]() {
            for (int i = 0; i < 100; ++i) {
                const auto& from = accounts[(t + i) % accounts.size()];
                const auto& to = accounts[(t + i + 1 + t % 2) % accounts.size()];
                try {
                    orchestrator_->transfer(from, to, Decimal::parse("37.50"), "");
                } catch (const InsufficientFundsException&) {
                    ++rejected;
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    Decimal total;
    for (const auto& id : accounts) {
        auto balance = balanceOf(id);
        EXPECT_FALSE(balance.isNegative()) << id;
        total += balance;
    }
    EXPECT_EQ(total.toString(), "400.0000");

    auto report = LedgerAuditor(store_).audit();
    EXPECT_TRUE(report.clean());
}
