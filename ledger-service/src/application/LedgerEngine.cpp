#include "application/LedgerEngine.hpp"
#include "application/LockOrdering.hpp"
#include "domain/LedgerErrors.hpp"
#include "utils/UuidGenerator.hpp"

#include <iostream>
#include <map>

namespace corebank::application {

const domain::Decimal LedgerEngine::BALANCE_TOLERANCE = domain::Decimal::fromMinorUnits(1, 2);

LedgerEngine::LedgerEngine(std::shared_ptr<ports::output::IAccountStore> store)
    : store_(std::move(store))
{
    std::clog << "[LedgerEngine] Created" << std::endl;
}

domain::MovementRecord LedgerEngine::deposit(
    const std::string& accountId,
    const domain::Decimal& amount,
    const std::string& description)
{
    auto value = amount.quantize(domain::Decimal::MONEY_SCALE);
    if (!value.isPositive()) {
        throw domain::ValidationException("Deposit amount must be positive");
    }

    auto result = createBalancedTransaction(
        domain::TransactionKind::DEPOSIT,
        {
            domain::EntryRequest::credit(accountId, value, description),
            domain::EntryRequest::virtualLeg(domain::EntryType::DEBIT, value, "Cash in")
        },
        description
    );

    auto movement = movementFor(result, accountId);
    std::clog << "[LedgerEngine] Deposit " << value.toString() << " to " << accountId
              << ", balance " << movement.balanceAfter.toString() << std::endl;
    return movement;
}

domain::MovementRecord LedgerEngine::withdraw(
    const std::string& accountId,
    const domain::Decimal& amount,
    const std::string& description)
{
    auto value = amount.quantize(domain::Decimal::MONEY_SCALE);
    if (!value.isPositive()) {
        throw domain::ValidationException("Withdrawal amount must be positive");
    }

    auto result = createBalancedTransaction(
        domain::TransactionKind::WITHDRAWAL,
        {
            domain::EntryRequest::debit(accountId, value, description),
            domain::EntryRequest::virtualLeg(domain::EntryType::CREDIT, value, "Cash out")
        },
        description
    );

    auto movement = movementFor(result, accountId);
    std::clog << "[LedgerEngine] Withdrawal " << value.toString() << " from " << accountId
              << ", balance " << movement.balanceAfter.toString() << std::endl;
    return movement;
}

domain::BalancedTransaction LedgerEngine::createBalancedTransaction(
    domain::TransactionKind kind,
    const std::vector<domain::EntryRequest>& entries,
    const std::string& description)
{
    auto unitOfWork = store_->beginUnitOfWork();
    try {
        auto result = applyBalancedTransaction(*unitOfWork, kind, entries, description);
        unitOfWork->commit();
        return result;
    } catch (const domain::LedgerException& e) {
        unitOfWork->abort();
        std::cerr << "[LedgerEngine] " << domain::toString(kind) << " aborted ("
                  << domain::toString(e.kind()) << "): " << e.what() << std::endl;
        throw;
    }
}

void LedgerEngine::validateEntries(const std::vector<domain::EntryRequest>& entries) {
    if (entries.size() < 2) {
        throw domain::ValidationException("Balanced transaction requires at least two entries");
    }

    domain::Decimal debits;
    domain::Decimal credits;
    for (const auto& entry : entries) {
        auto amount = entry.amount.quantize(domain::Decimal::MONEY_SCALE);
        if (!amount.isPositive()) {
            throw domain::ValidationException("Entry amount must be positive");
        }
        if (entry.entryType == domain::EntryType::DEBIT) {
            debits += amount;
        } else {
            credits += amount;
        }
    }

    if ((debits - credits).abs() > BALANCE_TOLERANCE) {
        throw domain::ImbalancedEntriesException(
            "Debits " + debits.toString() + " do not match credits " + credits.toString());
    }
}

domain::BalancedTransaction LedgerEngine::applyBalancedTransaction(
    ports::output::IUnitOfWork& unitOfWork,
    domain::TransactionKind kind,
    const std::vector<domain::EntryRequest>& entries,
    const std::string& description)
{
    validateEntries(entries);

    // Блокировки в глобальном порядке, до любых вычислений
    std::map<std::string, domain::Decimal> balances;
    for (const auto& accountId : LockOrdering::acquisitionOrder(entries)) {
        auto account = unitOfWork.getAccountForUpdate(accountId);
        if (!account) {
            throw domain::NotFoundException("Account not found: " + accountId);
        }
        balances[accountId] = account->balance;
    }

    auto now = domain::Timestamp::now();

    domain::BalancedTransaction result;
    result.group.id = utils::UuidGenerator::generate();
    result.group.kind = kind;
    result.group.description = description;
    result.group.status = domain::TransactionStatus::COMPLETED;
    result.group.createdAt = now;
    result.group.updatedAt = now;

    for (const auto& request : entries) {
        domain::TransactionEntry entry;
        entry.id = utils::UuidGenerator::generate();
        entry.groupId = result.group.id;
        entry.accountId = request.accountId;
        entry.entryType = request.entryType;
        entry.amount = request.amount.quantize(domain::Decimal::MONEY_SCALE);
        entry.description = request.description.empty() ? description : request.description;
        entry.createdAt = now;

        if (entry.entryType == domain::EntryType::DEBIT) {
            result.group.totalAmount += entry.amount;
        }

        if (request.accountId) {
            auto& balance = balances[*request.accountId];
            auto updated = entry.entryType == domain::EntryType::DEBIT
                ? balance - entry.amount
                : balance + entry.amount;
            if (updated.isNegative()) {
                throw domain::InsufficientFundsException(
                    "Insufficient funds in account " + *request.accountId +
                    ": balance " + balance.toString() + ", requested " + entry.amount.toString());
            }
            balance = updated;
            entry.balanceAfter = updated;
        }

        result.entries.push_back(entry);
    }

    unitOfWork.insertTransactionGroup(result.group);
    for (const auto& [accountId, balance] : balances) {
        if (!unitOfWork.setBalance(accountId, balance)) {
            throw domain::NotFoundException("Account not found: " + accountId);
        }
    }
    for (const auto& entry : result.entries) {
        unitOfWork.insertTransactionEntry(entry);
    }

    return result;
}

domain::MovementRecord LedgerEngine::movementFor(
    const domain::BalancedTransaction& transaction,
    const std::string& accountId,
    const std::optional<std::string>& relatedAccountId)
{
    for (const auto& entry : transaction.entries) {
        if (entry.accountId != accountId) {
            continue;
        }
        domain::MovementRecord movement;
        movement.groupId = transaction.group.id;
        movement.entryId = entry.id;
        movement.accountId = accountId;
        movement.kind = transaction.group.kind;
        movement.amount = entry.amount;
        movement.entryType = entry.entryType;
        movement.balanceAfter = entry.balanceAfter.value_or(domain::Decimal());
        movement.description = entry.description;
        movement.status = transaction.group.status;
        movement.createdAt = entry.createdAt;
        movement.relatedAccountId = relatedAccountId;
        return movement;
    }
    throw domain::NotFoundException("No entry for account " + accountId + " in group " + transaction.group.id);
}

} // namespace corebank::application
