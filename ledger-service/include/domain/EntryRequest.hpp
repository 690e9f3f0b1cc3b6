#pragma once

#include "enums/EntryType.hpp"
#include "Decimal.hpp"
#include <optional>
#include <string>

namespace corebank::domain {

/**
 * @brief Запрос на одну ногу сбалансированной транзакции
 */
struct EntryRequest {
    std::optional<std::string> accountId;   ///< nullopt = виртуальная нога
    EntryType entryType = EntryType::DEBIT;
    Decimal amount;
    std::string description;

    static EntryRequest debit(const std::string& accountId, Decimal amount, const std::string& description = "") {
        return EntryRequest{accountId, EntryType::DEBIT, amount, description};
    }

    static EntryRequest credit(const std::string& accountId, Decimal amount, const std::string& description = "") {
        return EntryRequest{accountId, EntryType::CREDIT, amount, description};
    }

    static EntryRequest virtualLeg(EntryType type, Decimal amount, const std::string& description = "") {
        return EntryRequest{std::nullopt, type, amount, description};
    }
};

} // namespace corebank::domain
