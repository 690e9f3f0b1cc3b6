#pragma once

#include "enums/AccountType.hpp"
#include "Decimal.hpp"
#include "Timestamp.hpp"
#include <string>

namespace corebank::domain {

/**
 * @brief Банковский счёт клиента
 *
 * Баланс меняет только LedgerEngine через проводки. Счёт никогда не удаляется.
 */
struct Account {
    std::string id;             ///< UUID счёта
    std::string number;         ///< "ACC" + 12 цифр, уникален
    std::string ownerId;        ///< ID пользователя-владельца
    AccountType type = AccountType::CHECKING;
    Decimal balance;            ///< Scale 4, после коммита не бывает отрицательным
    Timestamp createdAt;
    Timestamp updatedAt;

    Account() = default;

    Account(
        const std::string& id,
        const std::string& number,
        const std::string& ownerId,
        AccountType type,
        Decimal balance = Decimal()
    ) : id(id), number(number), ownerId(ownerId), type(type),
        balance(balance), createdAt(Timestamp::now()), updatedAt(createdAt) {}
};

} // namespace corebank::domain
