#pragma once

#include "domain/AccountReports.hpp"
#include "domain/Decimal.hpp"
#include "domain/MovementRecord.hpp"
#include <string>
#include <utility>

namespace corebank::ports::input {

/**
 * @brief Интерфейс сервиса движения денег
 *
 * Input Port. Проверяет права пользователя на счета и лимиты операций,
 * затем передаёт движение в LedgerEngine.
 */
class ILedgerService {
public:
    virtual ~ILedgerService() = default;

    /**
     * @brief Пополнить счёт пользователя
     *
     * @throws NotFoundException если счёт не найден или принадлежит другому пользователю
     * @throws ValidationException если сумма меньше минимальной
     */
    virtual domain::MovementRecord deposit(
        const std::string& userId,
        const std::string& accountId,
        const domain::Decimal& amount,
        const std::string& description
    ) = 0;

    /**
     * @brief Снять деньги со счёта
     *
     * @throws ValidationException если сумма вне [min, maxWithdrawal]
     * @throws InsufficientFundsException если баланса не хватает
     */
    virtual domain::MovementRecord withdraw(
        const std::string& userId,
        const std::string& accountId,
        const domain::Decimal& amount,
        const std::string& description
    ) = 0;

    /**
     * @brief Перевести между счетами пользователя
     *
     * @return (запись списания, запись зачисления)
     * @throws BusinessRuleException при переводе на тот же счёт
     */
    virtual std::pair<domain::MovementRecord, domain::MovementRecord> transfer(
        const std::string& userId,
        const std::string& fromAccountId,
        const std::string& toAccountId,
        const domain::Decimal& amount,
        const std::string& description
    ) = 0;

    /**
     * @brief Группа проводок, если пользователь владеет хотя бы одним её счётом
     * @throws NotFoundException если группы нет или доступ запрещён
     */
    virtual domain::BalancedTransaction getTransactionGroup(
        const std::string& userId,
        const std::string& groupId
    ) = 0;

    /**
     * @param page Номер страницы, с 1
     */
    virtual domain::AccountHistoryPage getAccountHistory(
        const std::string& userId,
        const std::string& accountId,
        int page,
        int pageSize
    ) = 0;

    virtual domain::TransactionSummary getTransactionSummary(
        const std::string& userId,
        const std::string& accountId
    ) = 0;
};

} // namespace corebank::ports::input
