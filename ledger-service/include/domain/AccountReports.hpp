#pragma once

#include "Decimal.hpp"
#include "TransactionEntry.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace corebank::domain {

/**
 * @brief Страница истории проводок по счёту
 */
struct AccountHistoryPage {
    std::vector<TransactionEntry> entries;
    int64_t totalCount = 0;
    int page = 1;
    int pageSize = 20;
};

/**
 * @brief Сводка движений по одному счёту
 */
struct TransactionSummary {
    std::string accountId;
    std::map<std::string, int64_t> countsByKind;   ///< "deposit" -> 3
    Decimal totalDeposits;
    Decimal totalWithdrawals;
    Decimal totalTransfersIn;
    Decimal totalTransfersOut;
    int64_t totalTransactions = 0;
};

/**
 * @brief Сводка по всем счетам пользователя
 */
struct AccountSummary {
    int64_t totalAccounts = 0;
    Decimal totalBalance;
    int64_t checkingAccounts = 0;
    int64_t savingsAccounts = 0;
};

} // namespace corebank::domain
