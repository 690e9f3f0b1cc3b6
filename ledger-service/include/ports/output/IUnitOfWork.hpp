#pragma once

#include "domain/Account.hpp"
#include "domain/Decimal.hpp"
#include "domain/InvestmentHolding.hpp"
#include "domain/InvestmentTransaction.hpp"
#include "domain/TransactionEntry.hpp"
#include "domain/TransactionGroup.hpp"
#include <optional>
#include <string>

namespace corebank::ports::output {

/**
 * @brief Одна атомарная изолированная единица работы над хранилищем
 *
 * Все изменения невидимы другим читателям до commit() и отбрасываются
 * при abort() или при разрушении объекта без commit().
 *
 * Блокировки строк держатся до конца единицы работы. Чтобы исключить
 * взаимоблокировки, вызывающий захватывает сначала все счета
 * в порядке возрастания id, затем позиции.
 *
 * Ошибки хранилища выбрасываются как StoreFailureException.
 */
class IUnitOfWork {
public:
    virtual ~IUnitOfWork() = default;

    /**
     * @brief Прочитать счёт с эксклюзивной блокировкой строки
     *
     * Блокирует вызывающего, пока другая единица работы держит строку.
     * Повторный захват уже удерживаемой строки ничего не делает.
     *
     * @return Account (с учётом изменений этой единицы работы) или nullopt
     */
    virtual std::optional<domain::Account> getAccountForUpdate(const std::string& accountId) = 0;

    /**
     * @brief Добавить новый счёт в этой единице работы
     *
     * Строка нового счёта считается заблокированной до конца единицы работы,
     * поэтому начальный взнос можно провести тем же коммитом.
     *
     * @throws BusinessRuleException id или номер счёта уже заняты
     */
    virtual void insertAccount(const domain::Account& account) = 0;

    /**
     * @brief Записать новый баланс заблокированного счёта
     * @return false если счёт не найден
     */
    virtual bool setBalance(const std::string& accountId, const domain::Decimal& balance) = 0;

    virtual void insertTransactionGroup(const domain::TransactionGroup& group) = 0;

    virtual void insertTransactionEntry(const domain::TransactionEntry& entry) = 0;

    /**
     * @brief Найти и заблокировать ACTIVE позицию пользователя по продукту
     *
     * Блокирует ключ (userId, productId) даже если позиции ещё нет,
     * поэтому две параллельные первые покупки не создадут две позиции.
     */
    virtual std::optional<domain::InvestmentHolding> findActiveHoldingForUpdate(
        const std::string& userId,
        const std::string& productId
    ) = 0;

    virtual std::optional<domain::InvestmentHolding> getHoldingForUpdate(const std::string& holdingId) = 0;

    virtual void insertHolding(const domain::InvestmentHolding& holding) = 0;

    virtual void updateHolding(const domain::InvestmentHolding& holding) = 0;

    virtual void insertInvestmentTransaction(const domain::InvestmentTransaction& transaction) = 0;

    /**
     * @brief Зафиксировать все изменения и отпустить блокировки
     * @throws StoreFailureException если фиксация не удалась (изменения отброшены)
     */
    virtual void commit() = 0;

    /**
     * @brief Отбросить изменения и отпустить блокировки. Идемпотентен.
     */
    virtual void abort() = 0;
};

} // namespace corebank::ports::output
