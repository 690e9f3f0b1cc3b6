#pragma once

#include "domain/Decimal.hpp"
#include "domain/InvestmentHolding.hpp"

namespace corebank::application {

/**
 * @brief Оценка позиции по цене пая
 *
 * Чистая функция: одинаковые позиция и цена дают одинаковый результат.
 */
class HoldingValuator {
public:
    static domain::HoldingValuation valuate(
        const domain::InvestmentHolding& holding,
        const domain::Decimal& unitPrice)
    {
        constexpr int scale = domain::Decimal::MONEY_SCALE;

        domain::HoldingValuation valuation;
        valuation.unitPrice = unitPrice;
        valuation.currentValue = domain::Decimal::multiply(holding.shares, unitPrice).quantize(scale);
        valuation.unrealizedGainLoss = (valuation.currentValue - holding.totalInvested).quantize(scale);
        valuation.returnRate = percentOf(valuation.unrealizedGainLoss, holding.totalInvested);
        return valuation;
    }

    /**
     * @brief part / whole * 100, 4 знака; 0 если whole == 0
     */
    static domain::Decimal percentOf(const domain::Decimal& part, const domain::Decimal& whole) {
        if (whole.isZero()) {
            return domain::Decimal();
        }
        auto scaled = domain::Decimal::multiply(part, domain::Decimal::fromInt(100));
        return domain::Decimal::divide(scaled, whole).quantize(domain::Decimal::MONEY_SCALE);
    }
};

} // namespace corebank::application
