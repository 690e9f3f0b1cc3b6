#pragma once

#include "enums/ProductType.hpp"
#include "Decimal.hpp"
#include <optional>
#include <string>

namespace corebank::domain {

/**
 * @brief Инвестиционный продукт из каталога
 */
struct InvestmentProduct {
    std::string id;
    std::string code;                           ///< Уникальный код продукта
    std::string name;
    ProductType type = ProductType::MONEY_FUND;
    int riskLevel = 1;                          ///< 1..5
    std::optional<Decimal> expectedReturnRate;  ///< Годовая доходность, %
    Decimal minInvestmentAmount = Decimal::fromInt(1);
    std::optional<Decimal> maxInvestmentAmount;
    std::optional<int> investmentPeriodDays;    ///< Только для FIXED_TERM
    bool active = true;
};

} // namespace corebank::domain
