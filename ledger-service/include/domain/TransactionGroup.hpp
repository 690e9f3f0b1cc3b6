#pragma once

#include "enums/TransactionKind.hpp"
#include "enums/TransactionStatus.hpp"
#include "Decimal.hpp"
#include "Timestamp.hpp"
#include <string>

namespace corebank::domain {

/**
 * @brief Одно логическое движение денег (заголовок группы проводок)
 *
 * Создаётся в одной единице работы вместе со своими проводками.
 */
struct TransactionGroup {
    std::string id;
    TransactionKind kind = TransactionKind::DEPOSIT;
    std::string description;
    Decimal totalAmount;        ///< > 0, сумма дебетовых ног
    TransactionStatus status = TransactionStatus::COMPLETED;
    Timestamp createdAt;
    Timestamp updatedAt;
};

} // namespace corebank::domain
