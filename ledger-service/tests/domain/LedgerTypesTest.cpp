#include <gtest/gtest.h>

#include "domain/EntryRequest.hpp"
#include "domain/LedgerErrors.hpp"
#include "domain/Timestamp.hpp"
#include "domain/enums/AccountType.hpp"
#include "domain/enums/EntryType.hpp"
#include "domain/enums/HoldingStatus.hpp"
#include "domain/enums/InvestmentTransactionKind.hpp"
#include "domain/enums/ProductType.hpp"
#include "domain/enums/TransactionKind.hpp"
#include "domain/enums/TransactionStatus.hpp"

#include <limits>

using namespace corebank::domain;

TEST(LedgerTypesTest, EnumsRoundTripThroughStrings) {
    EXPECT_EQ(accountTypeFromString("savings"), AccountType::SAVINGS);
    EXPECT_EQ(toString(TransactionKind::INVESTMENT_REDEMPTION), "investment_redemption");
    EXPECT_EQ(transactionKindFromString("transfer"), TransactionKind::TRANSFER);
    EXPECT_EQ(holdingStatusFromString("redeemed"), HoldingStatus::REDEEMED);
    EXPECT_EQ(investmentTransactionKindFromString("purchase"), InvestmentTransactionKind::PURCHASE);
    EXPECT_EQ(opposite(EntryType::DEBIT), EntryType::CREDIT);
}

TEST(LedgerTypesTest, UnknownEnumValuesThrow) {
    EXPECT_THROW(accountTypeFromString("brokerage"), std::invalid_argument);
    EXPECT_THROW(entryTypeFromString("both"), std::invalid_argument);
}

TEST(LedgerTypesTest, UnknownProductTypeBecomesOther) {
    EXPECT_EQ(productTypeFromString("crypto"), ProductType::OTHER);
}

TEST(LedgerTypesTest, FinalTransactionStatuses) {
    EXPECT_TRUE(isFinalStatus(TransactionStatus::COMPLETED));
    EXPECT_TRUE(isFinalStatus(TransactionStatus::CANCELLED));
    EXPECT_FALSE(isFinalStatus(TransactionStatus::PENDING));
}

TEST(LedgerTypesTest, OnlyStoreFailureIsRetryable) {
    EXPECT_TRUE(isRetryable(ErrorKind::STORE_FAILURE));
    EXPECT_FALSE(isRetryable(ErrorKind::INSUFFICIENT_FUNDS));
    EXPECT_FALSE(isRetryable(ErrorKind::VALIDATION));

    InsufficientFundsException e("no money");
    EXPECT_EQ(toString(e.kind()), "insufficient_funds");
}

TEST(LedgerTypesTest, VirtualLegHasNoAccount) {
    auto leg = EntryRequest::virtualLeg(EntryType::DEBIT, Decimal::fromInt(5), "Cash in");
    EXPECT_FALSE(leg.accountId.has_value());

    auto credit = EntryRequest::credit("acc-1", Decimal::fromInt(5), "Deposit");
    EXPECT_EQ(credit.accountId.value(), "acc-1");
    EXPECT_EQ(credit.entryType, EntryType::CREDIT);
}

TEST(LedgerTypesTest, TimestampParsesIsoAndPostgresFormats) {
    auto iso = Timestamp::fromString("2025-12-16T10:30:00Z");
    auto pg = Timestamp::fromString("2025-12-16 10:30:00");

    EXPECT_EQ(iso, pg);
    EXPECT_EQ(iso.toString(), "2025-12-16T10:30:00Z");
    EXPECT_EQ(Timestamp::fromDate("2025-12-16").toDateString(), "2025-12-16");
    EXPECT_EQ(iso.addDays(90).toUnixSeconds() - iso.toUnixSeconds(), 90 * 86400);
}
