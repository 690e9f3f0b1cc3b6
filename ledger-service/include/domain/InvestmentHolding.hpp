#pragma once

#include "enums/HoldingStatus.hpp"
#include "Decimal.hpp"
#include "Timestamp.hpp"
#include <optional>
#include <string>

namespace corebank::domain {

/**
 * @brief Позиция пользователя в одном продукте
 *
 * У пользователя не более одной ACTIVE позиции на продукт.
 * Повторная покупка сливается в неё по средневзвешенной цене.
 * REDEEMED терминален: новая покупка открывает новую позицию.
 */
struct InvestmentHolding {
    std::string id;
    std::string userId;
    std::string accountId;              ///< Счёт, с которого оплачена первая покупка
    std::string productId;
    Decimal shares;                     ///< Scale 8, >= 0
    Decimal averageCost;                ///< Scale 4, > 0
    Decimal totalInvested;              ///< Scale 4, >= 0
    Decimal realizedGainLoss;
    Timestamp purchaseDate;
    std::optional<Timestamp> maturityDate;
    HoldingStatus status = HoldingStatus::ACTIVE;
    Timestamp createdAt;
    Timestamp updatedAt;

    bool isActive() const { return status == HoldingStatus::ACTIVE; }
};

/**
 * @brief Оценка позиции по текущей цене
 *
 * Пересчитывается при каждом чтении, никогда не сохраняется.
 */
struct HoldingValuation {
    Decimal unitPrice;
    Decimal currentValue;           ///< shares * unitPrice, scale 4
    Decimal unrealizedGainLoss;     ///< currentValue - totalInvested, scale 4
    Decimal returnRate;             ///< %, scale 4; 0 при totalInvested == 0
};

} // namespace corebank::domain
