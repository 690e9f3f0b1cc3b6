#pragma once

#include "enums/EntryType.hpp"
#include "enums/TransactionKind.hpp"
#include "enums/TransactionStatus.hpp"
#include "TransactionEntry.hpp"
#include "TransactionGroup.hpp"
#include "Decimal.hpp"
#include "Timestamp.hpp"
#include <optional>
#include <string>
#include <vector>

namespace corebank::domain {

/**
 * @brief Результат движения денег с точки зрения клиента
 *
 * Отражает клиентскую ногу группы (не виртуальную).
 */
struct MovementRecord {
    std::string groupId;
    std::string entryId;
    std::string accountId;
    TransactionKind kind = TransactionKind::DEPOSIT;
    Decimal amount;
    EntryType entryType = EntryType::CREDIT;
    Decimal balanceAfter;
    std::string description;
    TransactionStatus status = TransactionStatus::COMPLETED;
    Timestamp createdAt;
    std::optional<std::string> relatedAccountId;   ///< Контрагент перевода
};

/**
 * @brief Заголовок группы вместе с проводками
 */
struct BalancedTransaction {
    TransactionGroup group;
    std::vector<TransactionEntry> entries;
};

} // namespace corebank::domain
