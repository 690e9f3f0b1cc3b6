#pragma once

#include "ports/output/IAccountStore.hpp"
#include "ports/output/IHoldingRepository.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <string>

namespace corebank::adapters::secondary {

/**
 * @brief PostgreSQL реализация хранилища счетов, журнала и позиций
 *
 * Таблицы:
 * - accounts: баланс NUMERIC(19,4) с CHECK (balance >= 0)
 * - transaction_groups / transaction_entries: журнал, только INSERT
 * - investment_holdings: паи NUMERIC(19,8), частичный уникальный индекс
 *   (user_id, product_id) WHERE status = 'active'
 * - investment_transactions
 *
 * Каждая единица работы открывает своё соединение и одну pqxx::work.
 * Ошибки libpqxx переводятся в StoreFailureException.
 */
class PostgresAccountStore : public ports::output::IAccountStore,
                             public ports::output::IHoldingRepository {
public:
    explicit PostgresAccountStore(std::shared_ptr<settings::DbSettings> settings);

    std::unique_ptr<ports::output::IUnitOfWork> beginUnitOfWork() override;

    void createAccount(const domain::Account& account) override;
    std::optional<domain::Account> findAccountById(const std::string& accountId) override;
    std::optional<domain::Account> findAccountByNumber(const std::string& number) override;
    std::vector<domain::Account> findAccountsByOwner(const std::string& ownerId) override;
    std::vector<domain::Account> findAllAccounts() override;

    std::optional<domain::TransactionGroup> findTransactionGroupById(const std::string& groupId) override;
    std::vector<domain::TransactionGroup> findAllTransactionGroups() override;
    std::vector<domain::TransactionEntry> findEntriesByGroupId(const std::string& groupId) override;
    std::vector<domain::TransactionEntry> findEntriesByAccountId(
        const std::string& accountId, int limit, int offset) override;
    int64_t countEntriesByAccountId(const std::string& accountId) override;

    std::optional<domain::InvestmentHolding> findHoldingById(const std::string& holdingId) override;
    std::vector<domain::InvestmentHolding> findHoldingsByUserId(const std::string& userId) override;
    std::vector<domain::InvestmentTransaction> findInvestmentTransactionsByUserId(
        const std::string& userId,
        const std::optional<std::string>& productId,
        const std::optional<domain::InvestmentTransactionKind>& kind,
        int limit,
        int offset) override;

    // Отображение строк в доменные структуры (используется и единицей работы)
    static domain::Account toAccount(const pqxx::row& row);
    static domain::TransactionGroup toGroup(const pqxx::row& row);
    static domain::TransactionEntry toEntry(const pqxx::row& row);
    static domain::InvestmentHolding toHolding(const pqxx::row& row);
    static domain::InvestmentTransaction toInvestmentTransaction(const pqxx::row& row);

private:
    std::shared_ptr<settings::DbSettings> settings_;

    void initSchema();
};

/**
 * @brief Единица работы: одна транзакция PostgreSQL (READ COMMITTED + FOR UPDATE)
 */
class PostgresUnitOfWork : public ports::output::IUnitOfWork {
public:
    explicit PostgresUnitOfWork(const std::string& connectionString);
    ~PostgresUnitOfWork() override;

    std::optional<domain::Account> getAccountForUpdate(const std::string& accountId) override;
    void insertAccount(const domain::Account& account) override;
    bool setBalance(const std::string& accountId, const domain::Decimal& balance) override;
    void insertTransactionGroup(const domain::TransactionGroup& group) override;
    void insertTransactionEntry(const domain::TransactionEntry& entry) override;

    std::optional<domain::InvestmentHolding> findActiveHoldingForUpdate(
        const std::string& userId, const std::string& productId) override;
    std::optional<domain::InvestmentHolding> getHoldingForUpdate(const std::string& holdingId) override;
    void insertHolding(const domain::InvestmentHolding& holding) override;
    void updateHolding(const domain::InvestmentHolding& holding) override;
    void insertInvestmentTransaction(const domain::InvestmentTransaction& transaction) override;

    void commit() override;
    void abort() override;

private:
    pqxx::work& txn();

    std::unique_ptr<pqxx::connection> conn_;
    std::unique_ptr<pqxx::work> txn_;
};

} // namespace corebank::adapters::secondary
