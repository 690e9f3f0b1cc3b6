#pragma once

#include "application/LedgerEngine.hpp"
#include "domain/AuditReport.hpp"
#include "ports/output/IAccountStore.hpp"
#include <iostream>
#include <memory>

namespace corebank::application {

/**
 * @brief Сверка журнала: двойная запись и неотрицательность балансов
 */
class LedgerAuditor {
public:
    explicit LedgerAuditor(std::shared_ptr<ports::output::IAccountStore> accountStore)
        : accountStore_(std::move(accountStore)) {}

    domain::AuditReport audit() {
        domain::AuditReport report;

        for (const auto& group : accountStore_->findAllTransactionGroups()) {
            ++report.groupsChecked;

            domain::Decimal debits;
            domain::Decimal credits;
            for (const auto& entry : accountStore_->findEntriesByGroupId(group.id)) {
                ++report.entriesChecked;
                if (!entry.amount.isPositive()) {
                    report.invalidEntryIds.push_back(entry.id);
                }
                if (entry.entryType == domain::EntryType::DEBIT) {
                    debits += entry.amount;
                } else {
                    credits += entry.amount;
                }
            }

            if ((debits - credits).abs() > LedgerEngine::BALANCE_TOLERANCE) {
                report.imbalancedGroups.push_back({group.id, debits, credits});
            }
        }

        for (const auto& account : accountStore_->findAllAccounts()) {
            ++report.accountsChecked;
            if (account.balance.isNegative()) {
                report.negativeBalances.push_back({account.id, account.balance});
            }
        }

        if (report.clean()) {
            std::clog << "[LedgerAuditor] Clean: " << report.groupsChecked << " groups, "
                      << report.entriesChecked << " entries" << std::endl;
        } else {
            std::cerr << "[LedgerAuditor] Violations: " << report.imbalancedGroups.size() << " imbalanced groups, "
                      << report.invalidEntryIds.size() << " invalid entries, "
                      << report.negativeBalances.size() << " negative balances" << std::endl;
        }
        return report;
    }

private:
    std::shared_ptr<ports::output::IAccountStore> accountStore_;
};

} // namespace corebank::application
