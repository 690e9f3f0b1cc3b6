#pragma once

#include "domain/Decimal.hpp"
#include "domain/EntryRequest.hpp"
#include "domain/MovementRecord.hpp"
#include "domain/enums/TransactionKind.hpp"
#include "ports/output/IAccountStore.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace corebank::application {

/**
 * @brief Ядро двойной записи
 *
 * Каждое движение денег - группа проводок, в которой сумма дебетов равна
 * сумме кредитов (допуск 0.01). Балансы меняются только здесь, под эксклюзивной
 * блокировкой строк, в одной единице работы с записью группы и проводок.
 *
 * Пополнение и снятие балансируются виртуальной кассовой ногой без счёта.
 */
class LedgerEngine {
public:
    static const domain::Decimal BALANCE_TOLERANCE;

    explicit LedgerEngine(std::shared_ptr<ports::output::IAccountStore> store);

    /**
     * @brief Зачислить amount на счёт
     *
     * Кредит счёта + дебет виртуальной ноги.
     *
     * @throws ValidationException amount <= 0
     * @throws NotFoundException счёта нет
     */
    domain::MovementRecord deposit(
        const std::string& accountId,
        const domain::Decimal& amount,
        const std::string& description
    );

    /**
     * @brief Списать amount со счёта
     *
     * @throws InsufficientFundsException баланс < amount (баланс не меняется)
     */
    domain::MovementRecord withdraw(
        const std::string& accountId,
        const domain::Decimal& amount,
        const std::string& description
    );

    /**
     * @brief Создать сбалансированную группу проводок в собственной единице работы
     *
     * При любой ошибке единица работы откатывается целиком и исключение пробрасывается.
     */
    domain::BalancedTransaction createBalancedTransaction(
        domain::TransactionKind kind,
        const std::vector<domain::EntryRequest>& entries,
        const std::string& description
    );

    /**
     * @brief То же внутри единицы работы вызывающего (без commit)
     *
     * Используется инвестиционным сервисом, чтобы записать проводки
     * и изменение позиции одним коммитом.
     */
    domain::BalancedTransaction applyBalancedTransaction(
        ports::output::IUnitOfWork& unitOfWork,
        domain::TransactionKind kind,
        const std::vector<domain::EntryRequest>& entries,
        const std::string& description
    );

    /**
     * @brief Клиентская запись движения по счёту accountId из группы
     */
    static domain::MovementRecord movementFor(
        const domain::BalancedTransaction& transaction,
        const std::string& accountId,
        const std::optional<std::string>& relatedAccountId = std::nullopt
    );

    /**
     * @throws ValidationException / ImbalancedEntriesException
     */
    static void validateEntries(const std::vector<domain::EntryRequest>& entries);

private:
    std::shared_ptr<ports::output::IAccountStore> store_;
};

} // namespace corebank::application
