#pragma once

#include "IUnitOfWork.hpp"
#include "domain/Account.hpp"
#include "domain/TransactionEntry.hpp"
#include "domain/TransactionGroup.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace corebank::ports::output {

/**
 * @brief Хранилище счетов и журнала проводок
 *
 * Output Port. Изменения баланса и журнала идут только через IUnitOfWork,
 * методы find* читают зафиксированное состояние.
 */
class IAccountStore {
public:
    virtual ~IAccountStore() = default;

    virtual std::unique_ptr<IUnitOfWork> beginUnitOfWork() = 0;

    /**
     * @brief Сохранить новый счёт (открытие счёта)
     * @throws BusinessRuleException если номер счёта уже занят
     */
    virtual void createAccount(const domain::Account& account) = 0;

    virtual std::optional<domain::Account> findAccountById(const std::string& accountId) = 0;

    virtual std::optional<domain::Account> findAccountByNumber(const std::string& number) = 0;

    virtual std::vector<domain::Account> findAccountsByOwner(const std::string& ownerId) = 0;

    virtual std::vector<domain::Account> findAllAccounts() = 0;

    virtual std::optional<domain::TransactionGroup> findTransactionGroupById(const std::string& groupId) = 0;

    virtual std::vector<domain::TransactionGroup> findAllTransactionGroups() = 0;

    virtual std::vector<domain::TransactionEntry> findEntriesByGroupId(const std::string& groupId) = 0;

    /**
     * @brief Проводки по счёту, новые первыми
     */
    virtual std::vector<domain::TransactionEntry> findEntriesByAccountId(
        const std::string& accountId,
        int limit,
        int offset
    ) = 0;

    virtual int64_t countEntriesByAccountId(const std::string& accountId) = 0;
};

} // namespace corebank::ports::output
