#include <gtest/gtest.h>

#include "application/LedgerEngine.hpp"
#include "adapters/secondary/persistence/InMemoryAccountStore.hpp"
#include "domain/LedgerErrors.hpp"

using namespace corebank;
using namespace corebank::domain;
using corebank::application::LedgerEngine;
using corebank::adapters::secondary::InMemoryAccountStore;

// ============================================================================
// Test Fixture
// ============================================================================

class LedgerEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<InMemoryAccountStore>();
        engine_ = std::make_shared<LedgerEngine>(store_);

        store_->createAccount(Account("acc-a", "ACC000000000001", "user-1", AccountType::CHECKING));
        store_->createAccount(Account("acc-b", "ACC000000000002", "user-1", AccountType::SAVINGS));
        store_->createAccount(Account("acc-c", "ACC000000000003", "user-2", AccountType::CHECKING));
    }

    Decimal balanceOf(const std::string& accountId) {
        return store_->findAccountById(accountId)->balance;
    }

    std::shared_ptr<InMemoryAccountStore> store_;
    std::shared_ptr<LedgerEngine> engine_;
};

// ============================================================================
// ТЕСТЫ: deposit / withdraw
// ============================================================================

TEST_F(LedgerEngineTest, Deposit_CreditsAccountAndPostsVirtualLeg) {
    auto movement = engine_->deposit("acc-a", Decimal::parse("100.00"), "Salary");

    EXPECT_EQ(movement.kind, TransactionKind::DEPOSIT);
    EXPECT_EQ(movement.entryType, EntryType::CREDIT);
    EXPECT_EQ(movement.balanceAfter.toString(), "100.0000");
    EXPECT_EQ(balanceOf("acc-a").toString(), "100.0000");

    auto entries = store_->findEntriesByGroupId(movement.groupId);
    ASSERT_EQ(entries.size(), 2u);

    int virtualLegs = 0;
    for (const auto& entry : entries) {
        if (entry.isVirtual()) {
            ++virtualLegs;
            EXPECT_EQ(entry.entryType, EntryType::DEBIT);
            EXPECT_FALSE(entry.balanceAfter.has_value());
        }
    }
    EXPECT_EQ(virtualLegs, 1);
}

TEST_F(LedgerEngineTest, Deposit_NonPositiveAmountRejected) {
    EXPECT_THROW(engine_->deposit("acc-a", Decimal(), "zero"), ValidationException);
    EXPECT_THROW(engine_->deposit("acc-a", Decimal::parse("-5"), "negative"), ValidationException);
    EXPECT_TRUE(store_->findAllTransactionGroups().empty());
}

TEST_F(LedgerEngineTest, Withdraw_InsufficientFundsLeavesNoTrace) {
    engine_->deposit("acc-a", Decimal::parse("50.00"), "Initial");

    EXPECT_THROW(engine_->withdraw("acc-a", Decimal::parse("50.01"), "Too much"), InsufficientFundsException);

    EXPECT_EQ(balanceOf("acc-a").toString(), "50.0000");
    EXPECT_EQ(store_->findAllTransactionGroups().size(), 1u);
    EXPECT_EQ(store_->countEntriesByAccountId("acc-a"), 1);
}

TEST_F(LedgerEngineTest, Withdraw_ExactBalanceReachesZero) {
    engine_->deposit("acc-a", Decimal::parse("50.00"), "Initial");

    auto movement = engine_->withdraw("acc-a", Decimal::parse("50.00"), "All");

    EXPECT_EQ(movement.entryType, EntryType::DEBIT);
    EXPECT_TRUE(balanceOf("acc-a").isZero());
}

TEST_F(LedgerEngineTest, UnknownAccount_NotFound) {
    EXPECT_THROW(engine_->deposit("missing", Decimal::fromInt(10), "x"), NotFoundException);
    EXPECT_TRUE(store_->findAllTransactionGroups().empty());
}

// ============================================================================
// ТЕСТЫ: createBalancedTransaction
// ============================================================================

TEST_F(LedgerEngineTest, Balanced_MultiLegSplitApplied) {
    engine_->deposit("acc-a", Decimal::fromInt(100), "Initial");

    auto result = engine_->createBalancedTransaction(
        TransactionKind::TRANSFER,
        {
            EntryRequest::debit("acc-a", Decimal::fromInt(10)),
            EntryRequest::credit("acc-b", Decimal::fromInt(6)),
            EntryRequest::credit("acc-c", Decimal::fromInt(4))
        },
        "Split");

    EXPECT_EQ(result.entries.size(), 3u);
    EXPECT_EQ(result.group.totalAmount.toString(), "10.0000");
    EXPECT_EQ(balanceOf("acc-a").toString(), "90.0000");
    EXPECT_EQ(balanceOf("acc-b").toString(), "6.0000");
    EXPECT_EQ(balanceOf("acc-c").toString(), "4.0000");

    for (const auto& entry : result.entries) {
        EXPECT_EQ(entry.description, "Split");
    }
}

TEST_F(LedgerEngineTest, Balanced_ImbalanceRejectedBeforeAnyLock) {
    engine_->deposit("acc-a", Decimal::fromInt(100), "Initial");

    EXPECT_THROW(engine_->createBalancedTransaction(
        TransactionKind::TRANSFER,
        {
            EntryRequest::debit("acc-a", Decimal::fromInt(10)),
            EntryRequest::credit("acc-b", Decimal::parse("9.98"))
        },
        "Broken"), ImbalancedEntriesException);

    EXPECT_EQ(balanceOf("acc-a").toString(), "100.0000");
    EXPECT_TRUE(balanceOf("acc-b").isZero());
}

TEST_F(LedgerEngineTest, Balanced_WithinToleranceAccepted) {
    engine_->deposit("acc-a", Decimal::fromInt(100), "Initial");

    EXPECT_NO_THROW(engine_->createBalancedTransaction(
        TransactionKind::TRANSFER,
        {
            EntryRequest::debit("acc-a", Decimal::fromInt(10)),
            EntryRequest::credit("acc-b", Decimal::parse("9.99"))
        },
        "Rounding"));
}

TEST_F(LedgerEngineTest, Balanced_RequiresTwoPositiveEntries) {
    EXPECT_THROW(engine_->createBalancedTransaction(
        TransactionKind::DEPOSIT,
        {EntryRequest::credit("acc-a", Decimal::fromInt(1))},
        "Single"), ValidationException);

    EXPECT_THROW(engine_->createBalancedTransaction(
        TransactionKind::TRANSFER,
        {
            EntryRequest::debit("acc-a", Decimal()),
            EntryRequest::credit("acc-b", Decimal())
        },
        "Zero"), ValidationException);
}

TEST_F(LedgerEngineTest, Balanced_NoPartialStateWhenOneLegOverdraws) {
    engine_->deposit("acc-a", Decimal::fromInt(100), "Initial");

    EXPECT_THROW(engine_->createBalancedTransaction(
        TransactionKind::TRANSFER,
        {
            EntryRequest::debit("acc-a", Decimal::fromInt(10)),
            EntryRequest::debit("acc-b", Decimal::fromInt(10)),
            EntryRequest::credit("acc-c", Decimal::fromInt(20))
        },
        "Partial"), InsufficientFundsException);

    EXPECT_EQ(balanceOf("acc-a").toString(), "100.0000");
    EXPECT_TRUE(balanceOf("acc-c").isZero());
    EXPECT_EQ(store_->findAllTransactionGroups().size(), 1u);
}

TEST_F(LedgerEngineTest, StoreFailure_IsRetryableAndAtomic) {
    engine_->deposit("acc-a", Decimal::fromInt(100), "Initial");
    store_->failNextCommits();

    try {
        engine_->withdraw("acc-a", Decimal::fromInt(40), "Fails");
        FAIL() << "Expected StoreFailureException";
    } catch (const StoreFailureException& e) {
        EXPECT_TRUE(isRetryable(e.kind()));
    }
    EXPECT_EQ(balanceOf("acc-a").toString(), "100.0000");

    // Повтор проходит
    auto movement = engine_->withdraw("acc-a", Decimal::fromInt(40), "Retry");
    EXPECT_EQ(movement.balanceAfter.toString(), "60.0000");
}

TEST_F(LedgerEngineTest, MovementFor_UnknownAccountThrows) {
    auto movement = engine_->deposit("acc-a", Decimal::fromInt(5), "x");
    BalancedTransaction txn;
    txn.group = *store_->findTransactionGroupById(movement.groupId);
    txn.entries = store_->findEntriesByGroupId(movement.groupId);

    EXPECT_THROW(LedgerEngine::movementFor(txn, "acc-b"), NotFoundException);
    EXPECT_EQ(LedgerEngine::movementFor(txn, "acc-a").entryId, movement.entryId);
}
