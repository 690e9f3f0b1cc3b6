#pragma once

#include "Decimal.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace corebank::domain {

/**
 * @brief Результат сверки журнала проводок
 */
struct AuditReport {
    struct ImbalancedGroup {
        std::string groupId;
        Decimal debits;
        Decimal credits;
    };

    struct NegativeBalance {
        std::string accountId;
        Decimal balance;
    };

    int64_t groupsChecked = 0;
    int64_t entriesChecked = 0;
    int64_t accountsChecked = 0;
    std::vector<ImbalancedGroup> imbalancedGroups;
    std::vector<std::string> invalidEntryIds;       ///< amount <= 0
    std::vector<NegativeBalance> negativeBalances;

    bool clean() const {
        return imbalancedGroups.empty() && invalidEntryIds.empty() && negativeBalances.empty();
    }
};

} // namespace corebank::domain
