#pragma once

#include "application/LedgerEngine.hpp"
#include "domain/LedgerErrors.hpp"
#include "ports/input/IAccountService.hpp"
#include "ports/output/IAccountStore.hpp"
#include "utils/UuidGenerator.hpp"
#include <iostream>
#include <memory>
#include <optional>

namespace corebank::application {

/**
 * @brief Сервис открытия и просмотра счетов
 */
class AccountService : public ports::input::IAccountService {
public:
    static constexpr int MAX_NUMBER_ATTEMPTS = 10;

    AccountService(
        std::shared_ptr<ports::output::IAccountStore> accountStore,
        std::shared_ptr<LedgerEngine> engine
    ) : accountStore_(std::move(accountStore))
      , engine_(std::move(engine))
    {}

    domain::Account openAccount(
        const std::string& userId,
        domain::AccountType type,
        const std::optional<domain::Decimal>& initialDeposit
    ) override {
        if (userId.empty()) {
            throw domain::ValidationException("User id is required");
        }
        std::optional<domain::Decimal> deposit;
        if (initialDeposit) {
            if (initialDeposit->isNegative()) {
                throw domain::ValidationException("Initial deposit must not be negative");
            }
            auto value = initialDeposit->quantize(domain::Decimal::MONEY_SCALE);
            if (value.isZero() && !initialDeposit->isZero()) {
                throw domain::ValidationException(
                    "Initial deposit is below the smallest money unit: " + initialDeposit->toString(domain::Decimal::SCALE));
            }
            if (value.isPositive()) {
                deposit = value;
            }
        }

        domain::Account account(
            utils::UuidGenerator::generate(),
            uniqueAccountNumber(),
            userId,
            type
        );

        // Счёт и начальный взнос фиксируются одним коммитом
        auto unitOfWork = accountStore_->beginUnitOfWork();
        try {
            unitOfWork->insertAccount(account);
            if (deposit) {
                auto ledger = engine_->applyBalancedTransaction(
                    *unitOfWork,
                    domain::TransactionKind::DEPOSIT,
                    {
                        domain::EntryRequest::credit(account.id, *deposit, "Initial deposit"),
                        domain::EntryRequest::virtualLeg(domain::EntryType::DEBIT, *deposit, "Cash in")
                    },
                    "Initial deposit"
                );
                account.balance = LedgerEngine::movementFor(ledger, account.id).balanceAfter;
            }
            unitOfWork->commit();
        } catch (const domain::LedgerException& e) {
            unitOfWork->abort();
            std::cerr << "[AccountService] Opening account for " << userId << " aborted ("
                      << domain::toString(e.kind()) << "): " << e.what() << std::endl;
            throw;
        }

        std::clog << "[AccountService] Opened " << domain::toString(type) << " account "
                  << account.number << " for " << userId
                  << ", balance " << account.balance.toString() << std::endl;
        return account;
    }

    domain::Account getAccount(const std::string& accountId) override {
        auto account = accountStore_->findAccountById(accountId);
        if (!account) {
            throw domain::NotFoundException("Account not found: " + accountId);
        }
        return *account;
    }

    std::vector<domain::Account> getUserAccounts(const std::string& userId) override {
        return accountStore_->findAccountsByOwner(userId);
    }

    domain::AccountSummary getAccountSummary(const std::string& userId) override {
        domain::AccountSummary summary;
        for (const auto& account : accountStore_->findAccountsByOwner(userId)) {
            ++summary.totalAccounts;
            summary.totalBalance += account.balance;
            if (account.type == domain::AccountType::CHECKING) {
                ++summary.checkingAccounts;
            } else {
                ++summary.savingsAccounts;
            }
        }
        return summary;
    }

private:
    std::shared_ptr<ports::output::IAccountStore> accountStore_;
    std::shared_ptr<LedgerEngine> engine_;

    std::string uniqueAccountNumber() {
        for (int attempt = 0; attempt < MAX_NUMBER_ATTEMPTS; ++attempt) {
            auto number = utils::UuidGenerator::generateAccountNumber();
            if (!accountStore_->findAccountByNumber(number)) {
                return number;
            }
        }
        throw domain::StoreFailureException("Could not allocate a unique account number");
    }
};

} // namespace corebank::application
