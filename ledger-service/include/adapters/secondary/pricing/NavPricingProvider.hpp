#pragma once

#include "ports/output/INavRepository.hpp"
#include "ports/output/IPricingProvider.hpp"
#include "settings/PricingSettings.hpp"
#include <iostream>
#include <memory>

namespace corebank::adapters::secondary {

/**
 * @brief Цена пая из последней записи NAV
 *
 * Для продукта без NAV возвращает цену по умолчанию из PricingSettings
 * (или nullopt, если она отключена).
 */
class NavPricingProvider : public ports::output::IPricingProvider {
public:
    NavPricingProvider(
        std::shared_ptr<ports::output::INavRepository> navRepository,
        std::shared_ptr<settings::PricingSettings> settings
    ) : navRepository_(std::move(navRepository)), settings_(std::move(settings)) {}

    std::optional<domain::Decimal> getCurrentUnitPrice(const std::string& productId) override {
        auto latest = navRepository_->findLatest(productId);
        if (latest) {
            return latest->unitPrice;
        }

        auto fallback = settings_->getDefaultUnitPrice();
        if (fallback) {
            std::clog << "[NavPricingProvider] No NAV for " << productId
                      << ", using default " << fallback->toString(4) << std::endl;
        }
        return fallback;
    }

private:
    std::shared_ptr<ports::output::INavRepository> navRepository_;
    std::shared_ptr<settings::PricingSettings> settings_;
};

} // namespace corebank::adapters::secondary
