#pragma once

#include "application/LedgerEngine.hpp"
#include "domain/LedgerErrors.hpp"
#include <iostream>
#include <memory>
#include <utility>

namespace corebank::application {

/**
 * @brief Перевод между двумя счетами
 *
 * Одна группа из двух проводок: дебет источника, кредит получателя,
 * обе с balanceAfter. Порядок блокировок задаёт LockOrdering внутри LedgerEngine.
 */
class TransferOrchestrator {
public:
    explicit TransferOrchestrator(std::shared_ptr<LedgerEngine> engine)
        : engine_(std::move(engine)) {}

    /**
     * @return (запись списания, запись зачисления)
     * @throws BusinessRuleException fromAccountId == toAccountId
     * @throws InsufficientFundsException баланс источника < amount
     */
    std::pair<domain::MovementRecord, domain::MovementRecord> transfer(
        const std::string& fromAccountId,
        const std::string& toAccountId,
        const domain::Decimal& amount,
        const std::string& description
    ) {
        if (fromAccountId == toAccountId) {
            throw domain::BusinessRuleException("Cannot transfer to the same account");
        }

        auto value = amount.quantize(domain::Decimal::MONEY_SCALE);
        auto result = engine_->createBalancedTransaction(
            domain::TransactionKind::TRANSFER,
            {
                domain::EntryRequest::debit(fromAccountId, value, description),
                domain::EntryRequest::credit(toAccountId, value, description)
            },
            description
        );

        auto outgoing = LedgerEngine::movementFor(result, fromAccountId, toAccountId);
        auto incoming = LedgerEngine::movementFor(result, toAccountId, fromAccountId);

        std::clog << "[TransferOrchestrator] Transfer " << value.toString() << " "
                  << fromAccountId << " -> " << toAccountId
                  << " (group " << result.group.id << ")" << std::endl;

        return {outgoing, incoming};
    }

private:
    std::shared_ptr<LedgerEngine> engine_;
};

} // namespace corebank::application
