#include <gtest/gtest.h>

#include "application/LedgerAuditor.hpp"
#include "application/LedgerEngine.hpp"
#include "adapters/secondary/persistence/InMemoryAccountStore.hpp"

using namespace corebank;
using namespace corebank::domain;
using corebank::application::LedgerAuditor;
using corebank::application::LedgerEngine;
using corebank::adapters::secondary::InMemoryAccountStore;

class LedgerAuditorTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<InMemoryAccountStore>();
        engine_ = std::make_shared<LedgerEngine>(store_);
        auditor_ = std::make_shared<LedgerAuditor>(store_);

        store_->createAccount(Account("acc-a", "ACC000000000001", "user-1", AccountType::CHECKING));
        store_->createAccount(Account("acc-b", "ACC000000000002", "user-1", AccountType::CHECKING));
    }

    // Запись в обход LedgerEngine, как это сделал бы повреждённый импорт
    void postRaw(const std::string& groupId, const std::vector<std::pair<EntryType, std::string>>& legs) {
        auto uow = store_->beginUnitOfWork();
        TransactionGroup group;
        group.id = groupId;
        group.kind = TransactionKind::TRANSFER;
        group.totalAmount = Decimal::fromInt(1);
        uow->insertTransactionGroup(group);

        int n = 0;
        for (const auto& [type, amount] : legs) {
            TransactionEntry entry;
            entry.id = groupId + "-" + std::to_string(++n);
            entry.groupId = groupId;
            entry.accountId = "acc-a";
            entry.entryType = type;
            entry.amount = Decimal::parse(amount);
            uow->insertTransactionEntry(entry);
        }
        uow->commit();
    }

    std::shared_ptr<InMemoryAccountStore> store_;
    std::shared_ptr<LedgerEngine> engine_;
    std::shared_ptr<LedgerAuditor> auditor_;
};

TEST_F(LedgerAuditorTest, CleanLedger) {
    engine_->deposit("acc-a", Decimal::fromInt(100), "Initial");
    engine_->withdraw("acc-a", Decimal::fromInt(30), "Cash");

    auto report = auditor_->audit();

    EXPECT_TRUE(report.clean());
    EXPECT_EQ(report.groupsChecked, 2);
    EXPECT_EQ(report.entriesChecked, 4);
    EXPECT_EQ(report.accountsChecked, 2);
}

TEST_F(LedgerAuditorTest, DetectsImbalancedGroup) {
    postRaw("broken", {{EntryType::DEBIT, "10.00"}, {EntryType::CREDIT, "9.00"}});

    auto report = auditor_->audit();

    EXPECT_FALSE(report.clean());
    ASSERT_EQ(report.imbalancedGroups.size(), 1u);
    EXPECT_EQ(report.imbalancedGroups[0].groupId, "broken");
    EXPECT_EQ(report.imbalancedGroups[0].debits.toString(), "10.0000");
    EXPECT_EQ(report.imbalancedGroups[0].credits.toString(), "9.0000");
}

TEST_F(LedgerAuditorTest, DetectsNonPositiveEntries) {
    postRaw("zero", {{EntryType::DEBIT, "0"}, {EntryType::CREDIT, "0"}});

    auto report = auditor_->audit();

    EXPECT_EQ(report.invalidEntryIds.size(), 2u);
    EXPECT_TRUE(report.imbalancedGroups.empty());
}

TEST_F(LedgerAuditorTest, DetectsNegativeBalance) {
    auto uow = store_->beginUnitOfWork();
    ASSERT_TRUE(uow->getAccountForUpdate("acc-b").has_value());
    ASSERT_TRUE(uow->setBalance("acc-b", Decimal::parse("-5.00")));
    uow->commit();

    auto report = auditor_->audit();

    ASSERT_EQ(report.negativeBalances.size(), 1u);
    EXPECT_EQ(report.negativeBalances[0].accountId, "acc-b");
}
