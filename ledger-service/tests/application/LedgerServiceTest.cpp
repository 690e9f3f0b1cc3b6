#include <gtest/gtest.h>

#include "application/AccountService.hpp"
#include "application/LedgerEngine.hpp"
#include "application/LedgerService.hpp"
#include "application/TransferOrchestrator.hpp"
#include "adapters/secondary/persistence/InMemoryAccountStore.hpp"
#include "domain/LedgerErrors.hpp"
#include "settings/LedgerSettings.hpp"

#include <limits>

using namespace corebank;
using namespace corebank::domain;
using namespace corebank::application;
using corebank::adapters::secondary::InMemoryAccountStore;
using corebank::settings::LedgerSettings;

// ============================================================================
// Test Fixture
// ============================================================================

class LedgerServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<InMemoryAccountStore>();
        engine_ = std::make_shared<LedgerEngine>(store_);
        auto settings = std::make_shared<LedgerSettings>(LedgerSettings::fromValues(
            Decimal::parse("0.01"), Decimal::parse("10000.00"), Decimal::parse("50000.00")));

        service_ = std::make_shared<LedgerService>(
            engine_, std::make_shared<TransferOrchestrator>(engine_), store_, settings);
        accounts_ = std::make_shared<AccountService>(store_, engine_);

        checking_ = accounts_->openAccount("alice", AccountType::CHECKING, Decimal::parse("1000.00")).id;
        savings_ = accounts_->openAccount("alice", AccountType::SAVINGS, std::nullopt).id;
        foreign_ = accounts_->openAccount("bob", AccountType::CHECKING, Decimal::parse("500.00")).id;
    }

    Decimal balanceOf(const std::string& accountId) {
        return store_->findAccountById(accountId)->balance;
    }

    std::shared_ptr<InMemoryAccountStore> store_;
    std::shared_ptr<LedgerEngine> engine_;
    std::shared_ptr<LedgerService> service_;
    std::shared_ptr<AccountService> accounts_;

    std::string checking_;
    std::string savings_;
    std::string foreign_;
};

// ============================================================================
// ТЕСТЫ: лимиты и права
// ============================================================================

TEST_F(LedgerServiceTest, Deposit_DefaultDescription) {
    auto movement = service_->deposit("alice", checking_, Decimal::parse("25.50"), "");

    EXPECT_EQ(movement.description, "Deposit");
    EXPECT_EQ(movement.balanceAfter.toString(), "1025.5000");
}

TEST_F(LedgerServiceTest, Deposit_BelowMinimumRejected) {
    EXPECT_THROW(service_->deposit("alice", checking_, Decimal::parse("0.001"), ""), ValidationException);
    EXPECT_THROW(service_->deposit("alice", checking_, Decimal(), ""), ValidationException);
}

TEST_F(LedgerServiceTest, Deposit_ForeignAccountLooksMissing) {
    EXPECT_THROW(service_->deposit("alice", foreign_, Decimal::fromInt(10), ""), NotFoundException);
    EXPECT_EQ(balanceOf(foreign_).toString(), "500.0000");
}

TEST_F(LedgerServiceTest, Withdraw_AboveLimitRejected) {
    service_->deposit("alice", checking_, Decimal::parse("20000.00"), "");

    EXPECT_THROW(service_->withdraw("alice", checking_, Decimal::parse("10000.01"), ""), ValidationException);
    EXPECT_NO_THROW(service_->withdraw("alice", checking_, Decimal::parse("10000.00"), ""));
}

TEST_F(LedgerServiceTest, Withdraw_InsufficientFunds) {
    EXPECT_THROW(service_->withdraw("alice", savings_, Decimal::fromInt(1), ""), InsufficientFundsException);
}

TEST_F(LedgerServiceTest, Transfer_BetweenOwnAccounts) {
    auto [out, in] = service_->transfer("alice", checking_, savings_, Decimal::parse("300.00"), "");

    EXPECT_EQ(out.description, "Transfer");
    EXPECT_EQ(balanceOf(checking_).toString(), "700.0000");
    EXPECT_EQ(balanceOf(savings_).toString(), "300.0000");
    EXPECT_EQ(in.relatedAccountId.value(), checking_);
}

TEST_F(LedgerServiceTest, Transfer_Rules) {
    EXPECT_THROW(service_->transfer("alice", checking_, checking_, Decimal::fromInt(1), ""), BusinessRuleException);
    EXPECT_THROW(service_->transfer("alice", checking_, foreign_, Decimal::fromInt(1), ""), NotFoundException);
    EXPECT_THROW(service_->transfer("bob", checking_, foreign_, Decimal::fromInt(1), ""), NotFoundException);
    EXPECT_THROW(service_->transfer("alice", checking_, savings_, Decimal::parse("50000.01"), ""), ValidationException);
    EXPECT_EQ(balanceOf(checking_).toString(), "1000.0000");
}

// ============================================================================
// ТЕСТЫ: чтение
// ============================================================================

TEST_F(LedgerServiceTest, TransactionGroup_VisibleOnlyToParticipants) {
    auto movement = service_->deposit("alice", checking_, Decimal::fromInt(10), "");

    auto group = service_->getTransactionGroup("alice", movement.groupId);
    EXPECT_EQ(group.group.kind, TransactionKind::DEPOSIT);
    EXPECT_EQ(group.entries.size(), 2u);

    EXPECT_THROW(service_->getTransactionGroup("bob", movement.groupId), NotFoundException);
    EXPECT_THROW(service_->getTransactionGroup("alice", "no-such-group"), NotFoundException);
}

TEST_F(LedgerServiceTest, History_PagedNewestFirst) {
    service_->deposit("alice", checking_, Decimal::fromInt(1), "first");
    service_->deposit("alice", checking_, Decimal::fromInt(2), "second");
    service_->deposit("alice", checking_, Decimal::fromInt(3), "third");

    auto page = service_->getAccountHistory("alice", checking_, 1, 2);
    EXPECT_EQ(page.totalCount, 4);  // + первое пополнение при открытии
    ASSERT_EQ(page.entries.size(), 2u);
    EXPECT_EQ(page.entries[0].description, "third");
    EXPECT_EQ(page.entries[1].description, "second");

    auto last = service_->getAccountHistory("alice", checking_, 2, 2);
    ASSERT_EQ(last.entries.size(), 2u);
    EXPECT_EQ(last.entries[1].description, "Initial deposit");

    EXPECT_TRUE(service_->getAccountHistory("alice", checking_, 5, 2).entries.empty());
}

TEST_F(LedgerServiceTest, History_HugePageIsEmpty) {
    auto far = service_->getAccountHistory("alice", checking_, 30000000, 100);
    EXPECT_EQ(far.totalCount, 1);
    EXPECT_EQ(far.page, 30000000);
    EXPECT_TRUE(far.entries.empty());

    auto last = service_->getAccountHistory("alice", checking_, std::numeric_limits<int>::max(), 100);
    EXPECT_TRUE(last.entries.empty());
}

TEST_F(LedgerServiceTest, History_PagingBoundsValidated) {
    EXPECT_THROW(service_->getAccountHistory("alice", checking_, 0, 20), ValidationException);
    EXPECT_THROW(service_->getAccountHistory("alice", checking_, 1, 0), ValidationException);
    EXPECT_THROW(service_->getAccountHistory("alice", checking_, 1, 101), ValidationException);
    EXPECT_THROW(service_->getAccountHistory("bob", checking_, 1, 20), NotFoundException);
}

TEST_F(LedgerServiceTest, Summary_TotalsByKind) {
    service_->withdraw("alice", checking_, Decimal::fromInt(100), "");
    service_->transfer("alice", checking_, savings_, Decimal::fromInt(200), "");
    service_->transfer("alice", savings_, checking_, Decimal::fromInt(50), "");

    auto summary = service_->getTransactionSummary("alice", checking_);

    EXPECT_EQ(summary.totalTransactions, 4);
    EXPECT_EQ(summary.countsByKind["deposit"], 1);
    EXPECT_EQ(summary.countsByKind["withdrawal"], 1);
    EXPECT_EQ(summary.countsByKind["transfer"], 2);
    EXPECT_EQ(summary.totalDeposits.toString(), "1000.0000");
    EXPECT_EQ(summary.totalWithdrawals.toString(), "100.0000");
    EXPECT_EQ(summary.totalTransfersOut.toString(), "200.0000");
    EXPECT_EQ(summary.totalTransfersIn.toString(), "50.0000");
}
