#pragma once

#include "ports/output/IAccountStore.hpp"
#include "ports/output/IHoldingRepository.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include <ThreadSafeMap.hpp>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace corebank::adapters::secondary {

class InMemoryUnitOfWork;

/**
 * @brief In-memory хранилище счетов, журнала и позиций
 *
 * Блокировки строк: по мьютексу на счёт, позицию и ключ (userId, productId),
 * удерживаются единицей работы до commit/abort. Изменения копятся в единице
 * работы и применяются при commit одним эксклюзивным захватом dataMutex_,
 * поэтому читатель никогда не видит баланс без его проводок.
 */
class InMemoryAccountStore : public ports::output::IAccountStore,
                             public ports::output::IHoldingRepository {
public:
    InMemoryAccountStore();

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

    /**
     * @brief Следующие count фиксаций завершатся StoreFailureException
     */
    void failNextCommits(int count = 1) { failCommits_.store(count); }

    /// Число мьютексов строк в реестре; ключ удаляется, когда его отпускает последний владелец
    size_t rowLockCount() const { return rowLocks_.size(); }

private:
    friend class InMemoryUnitOfWork;

    struct RowLock {
        std::mutex mutex;
    };

    /// Изменения одной единицы работы, применяются атомарно
    struct ChangeSet {
        std::vector<domain::Account> newAccounts;
        std::vector<domain::Account> accounts;
        std::vector<domain::TransactionGroup> groups;
        std::vector<domain::TransactionEntry> entries;
        std::vector<domain::InvestmentHolding> holdings;
        std::vector<domain::InvestmentTransaction> investmentTransactions;
    };

    std::shared_ptr<RowLock> rowLock(const std::string& key) { return rowLocks_.getOrCreate(key); }
    void dropRowLock(const std::string& key) { rowLocks_.removeIfUnused(key); }

    std::optional<domain::Account> readAccount(const std::string& accountId) const;
    std::optional<domain::InvestmentHolding> readHolding(const std::string& holdingId) const;
    std::optional<std::string> findActiveHoldingId(const std::string& userId, const std::string& productId) const;

    /**
     * @throws StoreFailureException при внедрённом сбое или нарушении уникальности
     *         активной позиции; в этом случае ничего не применяется
     */
    void apply(const ChangeSet& changes);

    ThreadSafeMap<std::string, RowLock> rowLocks_;
    std::atomic<int> failCommits_{0};

    mutable std::shared_mutex dataMutex_;
    std::unordered_map<std::string, domain::Account> accounts_;
    std::vector<std::string> accountOrder_;
    std::unordered_map<std::string, std::string> accountIdByNumber_;

    std::vector<domain::TransactionGroup> groups_;
    std::unordered_map<std::string, size_t> groupIndex_;
    std::vector<domain::TransactionEntry> entries_;

    std::unordered_map<std::string, domain::InvestmentHolding> holdings_;
    std::vector<std::string> holdingOrder_;
    std::vector<domain::InvestmentTransaction> investmentTransactions_;
};

/**
 * @brief Единица работы над InMemoryAccountStore
 *
 * Не потокобезопасна: принадлежит одному вызывающему потоку.
 */
class InMemoryUnitOfWork : public ports::output::IUnitOfWork {
public:
    explicit InMemoryUnitOfWork(InMemoryAccountStore& store);
    ~InMemoryUnitOfWork() override;

    InMemoryUnitOfWork(const InMemoryUnitOfWork&) = delete;
    InMemoryUnitOfWork& operator=(const InMemoryUnitOfWork&) = delete;

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
    struct HeldLock {
        std::shared_ptr<InMemoryAccountStore::RowLock> row;
        std::unique_lock<std::mutex> lock;
    };

    void acquire(const std::string& key);
    void ensureOpen() const;
    void release();

    InMemoryAccountStore& store_;
    bool finished_ = false;

    std::map<std::string, HeldLock> locks_;

    std::map<std::string, std::optional<domain::Account>> lockedAccounts_;
    std::set<std::string> dirtyAccounts_;
    std::set<std::string> newAccounts_;
    std::map<std::string, domain::InvestmentHolding> lockedHoldings_;
    std::set<std::string> dirtyHoldings_;
    std::vector<std::string> dirtyHoldingOrder_;

    InMemoryAccountStore::ChangeSet pending_;
};

} // namespace corebank::adapters::secondary
