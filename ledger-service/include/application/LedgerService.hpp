#pragma once

#include "application/LedgerEngine.hpp"
#include "application/TransferOrchestrator.hpp"
#include "ports/input/ILedgerService.hpp"
#include "ports/output/IAccountStore.hpp"
#include "settings/LedgerSettings.hpp"
#include <memory>

namespace corebank::application {

/**
 * @brief Движение денег от имени пользователя
 *
 * Проверяет лимиты LedgerSettings и права на счета, затем вызывает
 * LedgerEngine / TransferOrchestrator.
 */
class LedgerService : public ports::input::ILedgerService {
public:
    LedgerService(
        std::shared_ptr<LedgerEngine> engine,
        std::shared_ptr<TransferOrchestrator> orchestrator,
        std::shared_ptr<ports::output::IAccountStore> accountStore,
        std::shared_ptr<settings::LedgerSettings> settings
    );

    domain::MovementRecord deposit(
        const std::string& userId,
        const std::string& accountId,
        const domain::Decimal& amount,
        const std::string& description
    ) override;

    domain::MovementRecord withdraw(
        const std::string& userId,
        const std::string& accountId,
        const domain::Decimal& amount,
        const std::string& description
    ) override;

    std::pair<domain::MovementRecord, domain::MovementRecord> transfer(
        const std::string& userId,
        const std::string& fromAccountId,
        const std::string& toAccountId,
        const domain::Decimal& amount,
        const std::string& description
    ) override;

    domain::BalancedTransaction getTransactionGroup(
        const std::string& userId,
        const std::string& groupId
    ) override;

    domain::AccountHistoryPage getAccountHistory(
        const std::string& userId,
        const std::string& accountId,
        int page,
        int pageSize
    ) override;

    domain::TransactionSummary getTransactionSummary(
        const std::string& userId,
        const std::string& accountId
    ) override;

private:
    /**
     * @throws ValidationException сумма < минимума или > максимума
     */
    domain::Decimal checkAmount(
        const domain::Decimal& amount,
        const std::optional<domain::Decimal>& maximum,
        const std::string& operation) const;

    /**
     * @throws NotFoundException счёт не найден или чужой
     */
    void requireOwnership(const std::string& userId, const std::string& accountId, const std::string& role = "Account");

    std::shared_ptr<LedgerEngine> engine_;
    std::shared_ptr<TransferOrchestrator> orchestrator_;
    std::shared_ptr<ports::output::IAccountStore> accountStore_;
    std::shared_ptr<settings::LedgerSettings> settings_;
};

} // namespace corebank::application
