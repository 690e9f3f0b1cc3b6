#pragma once

#include "domain/InvestmentHolding.hpp"
#include "domain/InvestmentTransaction.hpp"
#include "domain/enums/InvestmentTransactionKind.hpp"
#include <optional>
#include <string>
#include <vector>

namespace corebank::ports::output {

/**
 * @brief Чтение позиций и инвестиционных операций
 *
 * Запись идёт через IUnitOfWork.
 */
class IHoldingRepository {
public:
    virtual ~IHoldingRepository() = default;

    virtual std::optional<domain::InvestmentHolding> findHoldingById(const std::string& holdingId) = 0;

    /**
     * @brief Все позиции пользователя (включая погашенные), новые первыми
     */
    virtual std::vector<domain::InvestmentHolding> findHoldingsByUserId(const std::string& userId) = 0;

    virtual std::vector<domain::InvestmentTransaction> findInvestmentTransactionsByUserId(
        const std::string& userId,
        const std::optional<std::string>& productId,
        const std::optional<domain::InvestmentTransactionKind>& kind,
        int limit,
        int offset
    ) = 0;
};

} // namespace corebank::ports::output
