#include "application/LedgerService.hpp"
#include "domain/LedgerErrors.hpp"

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <limits>
#include <set>

namespace corebank::application {

LedgerService::LedgerService(
    std::shared_ptr<LedgerEngine> engine,
    std::shared_ptr<TransferOrchestrator> orchestrator,
    std::shared_ptr<ports::output::IAccountStore> accountStore,
    std::shared_ptr<settings::LedgerSettings> settings)
    : engine_(std::move(engine))
    , orchestrator_(std::move(orchestrator))
    , accountStore_(std::move(accountStore))
    , settings_(std::move(settings))
{
    std::clog << "[LedgerService] Created (min " << settings_->getMinTransactionAmount().toString()
              << ", max withdrawal " << settings_->getMaxWithdrawalAmount().toString()
              << ", max transfer " << settings_->getMaxTransferAmount().toString() << ")" << std::endl;
}

domain::Decimal LedgerService::checkAmount(
    const domain::Decimal& amount,
    const std::optional<domain::Decimal>& maximum,
    const std::string& operation) const
{
    auto value = amount.quantize(domain::Decimal::MONEY_SCALE);
    if (value < settings_->getMinTransactionAmount()) {
        throw domain::ValidationException(
            "Minimum " + operation + " amount is " + settings_->getMinTransactionAmount().toString());
    }
    if (maximum && value > *maximum) {
        throw domain::ValidationException(
            "Maximum " + operation + " amount is " + maximum->toString());
    }
    return value;
}

void LedgerService::requireOwnership(const std::string& userId, const std::string& accountId, const std::string& role) {
    auto account = accountStore_->findAccountById(accountId);
    if (!account || account->ownerId != userId) {
        throw domain::NotFoundException(role + " not found or access denied");
    }
}

domain::MovementRecord LedgerService::deposit(
    const std::string& userId,
    const std::string& accountId,
    const domain::Decimal& amount,
    const std::string& description)
{
    auto value = checkAmount(amount, std::nullopt, "deposit");
    requireOwnership(userId, accountId);
    return engine_->deposit(accountId, value, description.empty() ? "Deposit" : description);
}

domain::MovementRecord LedgerService::withdraw(
    const std::string& userId,
    const std::string& accountId,
    const domain::Decimal& amount,
    const std::string& description)
{
    auto value = checkAmount(amount, settings_->getMaxWithdrawalAmount(), "withdrawal");
    requireOwnership(userId, accountId);
    return engine_->withdraw(accountId, value, description.empty() ? "Withdrawal" : description);
}

std::pair<domain::MovementRecord, domain::MovementRecord> LedgerService::transfer(
    const std::string& userId,
    const std::string& fromAccountId,
    const std::string& toAccountId,
    const domain::Decimal& amount,
    const std::string& description)
{
    auto value = checkAmount(amount, settings_->getMaxTransferAmount(), "transfer");
    if (fromAccountId == toAccountId) {
        throw domain::BusinessRuleException("Cannot transfer to the same account");
    }
    requireOwnership(userId, fromAccountId, "Source account");
    requireOwnership(userId, toAccountId, "Target account");
    return orchestrator_->transfer(fromAccountId, toAccountId, value, description.empty() ? "Transfer" : description);
}

domain::BalancedTransaction LedgerService::getTransactionGroup(
    const std::string& userId,
    const std::string& groupId)
{
    auto group = accountStore_->findTransactionGroupById(groupId);
    if (!group) {
        throw domain::NotFoundException("Transaction not found");
    }

    domain::BalancedTransaction result{*group, accountStore_->findEntriesByGroupId(groupId)};

    for (const auto& entry : result.entries) {
        if (!entry.accountId) continue;
        auto account = accountStore_->findAccountById(*entry.accountId);
        if (account && account->ownerId == userId) {
            return result;
        }
    }
    throw domain::NotFoundException("Transaction not found or access denied");
}

domain::AccountHistoryPage LedgerService::getAccountHistory(
    const std::string& userId,
    const std::string& accountId,
    int page,
    int pageSize)
{
    if (page < 1) {
        throw domain::ValidationException("page must be >= 1");
    }
    if (pageSize < 1 || pageSize > 100) {
        throw domain::ValidationException("pageSize must be between 1 and 100");
    }
    requireOwnership(userId, accountId);

    domain::AccountHistoryPage history;
    history.page = page;
    history.pageSize = pageSize;
    history.totalCount = accountStore_->countEntriesByAccountId(accountId);

    // Страница за концом истории пуста; смещение считается в 64 битах
    const int64_t offset = static_cast<int64_t>(page - 1) * pageSize;
    if (offset >= history.totalCount) {
        return history;
    }
    if (offset > std::numeric_limits<int>::max()) {
        throw domain::ValidationException("page is out of range");
    }
    history.entries = accountStore_->findEntriesByAccountId(accountId, pageSize, static_cast<int>(offset));
    return history;
}

domain::TransactionSummary LedgerService::getTransactionSummary(
    const std::string& userId,
    const std::string& accountId)
{
    requireOwnership(userId, accountId);

    domain::TransactionSummary summary;
    summary.accountId = accountId;

    auto total = accountStore_->countEntriesByAccountId(accountId);
    auto limit = static_cast<int>(std::min<int64_t>(total, std::numeric_limits<int>::max()));
    auto entries = accountStore_->findEntriesByAccountId(accountId, limit, 0);

    std::set<std::string> seenGroups;
    for (const auto& entry : entries) {
        auto group = accountStore_->findTransactionGroupById(entry.groupId);
        if (!group) {
            continue;
        }
        if (seenGroups.insert(group->id).second) {
            ++summary.countsByKind[domain::toString(group->kind)];
        }

        bool credit = entry.entryType == domain::EntryType::CREDIT;
        switch (group->kind) {
            case domain::TransactionKind::DEPOSIT:
                summary.totalDeposits += entry.amount;
                break;
            case domain::TransactionKind::WITHDRAWAL:
                summary.totalWithdrawals += entry.amount;
                break;
            case domain::TransactionKind::TRANSFER:
                (credit ? summary.totalTransfersIn : summary.totalTransfersOut) += entry.amount;
                break;
            case domain::TransactionKind::INVESTMENT_PURCHASE:
            case domain::TransactionKind::INVESTMENT_REDEMPTION:
                break;
        }
    }
    summary.totalTransactions = static_cast<int64_t>(seenGroups.size());
    return summary;
}

} // namespace corebank::application
