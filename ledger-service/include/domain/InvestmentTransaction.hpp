#pragma once

#include "enums/InvestmentTransactionKind.hpp"
#include "enums/InvestmentTransactionStatus.hpp"
#include "Decimal.hpp"
#include "Timestamp.hpp"
#include <optional>
#include <string>

namespace corebank::domain {

/**
 * @brief Запись о покупке/погашении паёв
 *
 * Неизменна после записи. Всегда netAmount = grossAmount - fee.
 * Покупка: grossAmount списан со счёта, netAmount превращён в паи.
 * Погашение: grossAmount = shares * unitPrice, netAmount зачислен на счёт.
 */
struct InvestmentTransaction {
    std::string id;
    std::string userId;
    std::string accountId;
    std::string productId;
    std::optional<std::string> holdingId;
    std::optional<std::string> transactionGroupId;  ///< Группа проводок по счёту
    InvestmentTransactionKind kind = InvestmentTransactionKind::PURCHASE;
    Decimal shares;
    Decimal unitPrice;
    Decimal grossAmount;
    Decimal fee;
    Decimal netAmount;
    InvestmentTransactionStatus status = InvestmentTransactionStatus::CONFIRMED;
    std::string description;
    Timestamp settlementDate;
    Timestamp createdAt;
};

} // namespace corebank::domain
