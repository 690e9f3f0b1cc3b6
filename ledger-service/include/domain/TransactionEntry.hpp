#pragma once

#include "enums/EntryType.hpp"
#include "Decimal.hpp"
#include "Timestamp.hpp"
#include <optional>
#include <string>

namespace corebank::domain {

/**
 * @brief Одна нога группы проводок
 *
 * Пустой accountId означает виртуальную кассовую ногу (пополнение/снятие):
 * у неё нет счёта-корреспондента и нет balanceAfter.
 */
struct TransactionEntry {
    std::string id;
    std::string groupId;
    std::optional<std::string> accountId;
    EntryType entryType = EntryType::DEBIT;
    Decimal amount;                         ///< > 0
    std::optional<Decimal> balanceAfter;    ///< Снимок баланса после применения
    std::string description;
    Timestamp createdAt;

    bool isVirtual() const { return !accountId.has_value(); }
};

} // namespace corebank::domain
