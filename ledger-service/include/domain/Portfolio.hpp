#pragma once

#include "Decimal.hpp"
#include "InvestmentHolding.hpp"
#include "InvestmentProduct.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace corebank::domain {

/**
 * @brief Позиция с продуктом и оценкой для отображения
 */
struct HoldingView {
    InvestmentHolding holding;
    InvestmentProduct product;
    HoldingValuation valuation;
};

/**
 * @brief Сводка инвестиционного портфеля пользователя
 *
 * Суммы считаются только по ACTIVE позициям, holdingsCount включает все.
 */
struct PortfolioSummary {
    Decimal totalAssets;
    Decimal totalInvested;
    Decimal totalGainLoss;
    Decimal totalReturnRate;                        ///< %
    std::map<std::string, Decimal> assetAllocation; ///< product type -> % от totalAssets
    int64_t holdingsCount = 0;
    int64_t activeProductsCount = 0;
};

} // namespace corebank::domain
