#pragma once

#include "domain/Decimal.hpp"
#include "domain/enums/ProductType.hpp"

namespace corebank::application {

/**
 * @brief Ставки комиссий по типу продукта
 *
 * | тип          | покупка | погашение |
 * |--------------|---------|-----------|
 * | money_fund   | 0%      | 0%        |
 * | fixed_term   | 0.50%   | 0.25%     |
 * | mutual_fund  | 1.50%   | 0.75%     |
 * | insurance    | 2.00%   | 1.00%     |
 * | прочие       | 1.00%   | 0.50%     |
 */
class FeeSchedule {
public:
    static domain::Decimal purchaseRate(domain::ProductType type) {
        switch (type) {
            case domain::ProductType::MONEY_FUND:  return domain::Decimal();
            case domain::ProductType::FIXED_TERM:  return domain::Decimal::fromMinorUnits(50, 4);
            case domain::ProductType::MUTUAL_FUND: return domain::Decimal::fromMinorUnits(150, 4);
            case domain::ProductType::INSURANCE:   return domain::Decimal::fromMinorUnits(200, 4);
            case domain::ProductType::OTHER:       break;
        }
        return domain::Decimal::fromMinorUnits(100, 4);
    }

    static domain::Decimal redemptionRate(domain::ProductType type) {
        switch (type) {
            case domain::ProductType::MONEY_FUND:  return domain::Decimal();
            case domain::ProductType::FIXED_TERM:  return domain::Decimal::fromMinorUnits(25, 4);
            case domain::ProductType::MUTUAL_FUND: return domain::Decimal::fromMinorUnits(75, 4);
            case domain::ProductType::INSURANCE:   return domain::Decimal::fromMinorUnits(100, 4);
            case domain::ProductType::OTHER:       break;
        }
        return domain::Decimal::fromMinorUnits(50, 4);
    }

    /// Комиссия, округлённая до 4 знаков
    static domain::Decimal purchaseFee(domain::ProductType type, const domain::Decimal& amount) {
        return domain::Decimal::multiply(amount, purchaseRate(type)).quantize(domain::Decimal::MONEY_SCALE);
    }

    static domain::Decimal redemptionFee(domain::ProductType type, const domain::Decimal& grossAmount) {
        return domain::Decimal::multiply(grossAmount, redemptionRate(type)).quantize(domain::Decimal::MONEY_SCALE);
    }
};

} // namespace corebank::application
