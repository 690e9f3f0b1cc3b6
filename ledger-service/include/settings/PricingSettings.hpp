#pragma once

#include "domain/Decimal.hpp"
#include "settings/Environment.hpp"
#include <optional>
#include <stdexcept>
#include <string>

namespace corebank::settings {

/**
 * @brief Настройки источника цен
 *
 * COREBANK_DEFAULT_UNIT_PRICE: цена пая для продукта без NAV (1.0000).
 * Значение "none" отключает цену по умолчанию, тогда покупка
 * продукта без NAV завершается NotFound.
 */
class PricingSettings {
public:
    PricingSettings() {
        if (env::getOrDefault("COREBANK_DEFAULT_UNIT_PRICE", "1.0000") == "none") {
            return;
        }
        defaultUnitPrice_ = env::getDecimal("COREBANK_DEFAULT_UNIT_PRICE", "1.0000");
        if (!defaultUnitPrice_->isPositive()) {
            throw std::invalid_argument("COREBANK_DEFAULT_UNIT_PRICE must be positive");
        }
    }

    static PricingSettings withDefaultPrice(const std::optional<domain::Decimal>& price) {
        PricingSettings settings;
        settings.defaultUnitPrice_ = price;
        return settings;
    }

    std::optional<domain::Decimal> getDefaultUnitPrice() const { return defaultUnitPrice_; }

private:
    std::optional<domain::Decimal> defaultUnitPrice_;
};

} // namespace corebank::settings
