#pragma once

#include "adapters/secondary/persistence/InMemoryAccountStore.hpp"
#include "ports/output/IAccountStore.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace corebank::tests {

/**
 * @brief IAccountStore поверх InMemoryAccountStore, записывающий порядок блокировок
 *
 * Каждая единица работы получает свой журнал; после commit/abort журнал
 * сохраняется в lockSequences().
 */
class RecordingAccountStore : public ports::output::IAccountStore {
public:
    RecordingAccountStore()
        : inner_(std::make_shared<adapters::secondary::InMemoryAccountStore>()) {}

    std::shared_ptr<adapters::secondary::InMemoryAccountStore> inner() const { return inner_; }

    std::vector<std::vector<std::string>> lockSequences() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sequences_;
    }

    int unitsOfWork() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<int>(sequences_.size());
    }

    std::unique_ptr<ports::output::IUnitOfWork> beginUnitOfWork() override {
        return std::make_unique<RecordingUnitOfWork>(*this, inner_->beginUnitOfWork());
    }

    void createAccount(const domain::Account& account) override { inner_->createAccount(account); }

    std::optional<domain::Account> findAccountById(const std::string& accountId) override {
        return inner_->findAccountById(accountId);
    }

    std::optional<domain::Account> findAccountByNumber(const std::string& number) override {
        return inner_->findAccountByNumber(number);
    }

    std::vector<domain::Account> findAccountsByOwner(const std::string& ownerId) override {
        return inner_->findAccountsByOwner(ownerId);
    }

    std::vector<domain::Account> findAllAccounts() override { return inner_->findAllAccounts(); }

    std::optional<domain::TransactionGroup> findTransactionGroupById(const std::string& groupId) override {
        return inner_->findTransactionGroupById(groupId);
    }

    std::vector<domain::TransactionGroup> findAllTransactionGroups() override {
        return inner_->findAllTransactionGroups();
    }

    std::vector<domain::TransactionEntry> findEntriesByGroupId(const std::string& groupId) override {
        return inner_->findEntriesByGroupId(groupId);
    }

    std::vector<domain::TransactionEntry> findEntriesByAccountId(
        const std::string& accountId, int limit, int offset) override {
        return inner_->findEntriesByAccountId(accountId, limit, offset);
    }

    int64_t countEntriesByAccountId(const std::string& accountId) override {
        return inner_->countEntriesByAccountId(accountId);
    }

private:
    class RecordingUnitOfWork : public ports::output::IUnitOfWork {
    public:
        RecordingUnitOfWork(RecordingAccountStore& owner, std::unique_ptr<ports::output::IUnitOfWork> inner)
            : owner_(owner), inner_(std::move(inner)) {}

        std::optional<domain::Account> getAccountForUpdate(const std::string& accountId) override {
            locked_.push_back(accountId);
            return inner_->getAccountForUpdate(accountId);
        }

        void insertAccount(const domain::Account& account) override { inner_->insertAccount(account); }

        bool setBalance(const std::string& accountId, const domain::Decimal& balance) override {
            return inner_->setBalance(accountId, balance);
        }

        void insertTransactionGroup(const domain::TransactionGroup& group) override {
            inner_->insertTransactionGroup(group);
        }

        void insertTransactionEntry(const domain::TransactionEntry& entry) override {
            inner_->insertTransactionEntry(entry);
        }

        std::optional<domain::InvestmentHolding> findActiveHoldingForUpdate(
            const std::string& userId, const std::string& productId) override {
            return inner_->findActiveHoldingForUpdate(userId, productId);
        }

        std::optional<domain::InvestmentHolding> getHoldingForUpdate(const std::string& holdingId) override {
            return inner_->getHoldingForUpdate(holdingId);
        }

        void insertHolding(const domain::InvestmentHolding& holding) override { inner_->insertHolding(holding); }
        void updateHolding(const domain::InvestmentHolding& holding) override { inner_->updateHolding(holding); }

        void insertInvestmentTransaction(const domain::InvestmentTransaction& transaction) override {
            inner_->insertInvestmentTransaction(transaction);
        }

        void commit() override {
            inner_->commit();
            record();
        }

        void abort() override {
            inner_->abort();
            record();
        }

    private:
        RecordingAccountStore& owner_;
        std::unique_ptr<ports::output::IUnitOfWork> inner_;
        std::vector<std::string> locked_;

        void record() {
            std::lock_guard<std::mutex> lock(owner_.mutex_);
            owner_.sequences_.push_back(locked_);
        }
    };

    std::shared_ptr<adapters::secondary::InMemoryAccountStore> inner_;
    mutable std::mutex mutex_;
    std::vector<std::vector<std::string>> sequences_;
};

} // namespace corebank::tests
