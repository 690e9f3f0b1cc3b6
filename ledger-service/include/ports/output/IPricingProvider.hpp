#pragma once

#include "domain/Decimal.hpp"
#include <optional>
#include <string>

namespace corebank::ports::output {

/**
 * @brief Источник текущей цены пая (только чтение)
 *
 * Вызывается до начала единицы работы, чтобы не держать блокировки
 * строк во время медленного запроса.
 */
class IPricingProvider {
public:
    virtual ~IPricingProvider() = default;

    /**
     * @return Цена > 0 или nullopt, если цена недоступна
     */
    virtual std::optional<domain::Decimal> getCurrentUnitPrice(const std::string& productId) = 0;
};

} // namespace corebank::ports::output
