#pragma once

#include <string>

namespace corebank::domain {

/**
 * @brief Тип инвестиционного продукта
 *
 * Тип определяет ставки комиссий (см. FeeSchedule).
 * Нераспознанные типы из хранилища становятся OTHER и получают ставку по умолчанию.
 */
enum class ProductType {
    MONEY_FUND,   ///< Фонд денежного рынка
    FIXED_TERM,   ///< Срочный продукт с датой погашения
    MUTUAL_FUND,  ///< Паевой фонд
    INSURANCE,    ///< Инвестиционное страхование
    OTHER
};

inline std::string toString(ProductType type) {
    switch (type) {
        case ProductType::MONEY_FUND:  return "money_fund";
        case ProductType::FIXED_TERM:  return "fixed_term";
        case ProductType::MUTUAL_FUND: return "mutual_fund";
        case ProductType::INSURANCE:   return "insurance";
        case ProductType::OTHER:       return "other";
    }
    return "other";
}

inline ProductType productTypeFromString(const std::string& str) {
    if (str == "money_fund")  return ProductType::MONEY_FUND;
    if (str == "fixed_term")  return ProductType::FIXED_TERM;
    if (str == "mutual_fund") return ProductType::MUTUAL_FUND;
    if (str == "insurance")   return ProductType::INSURANCE;
    return ProductType::OTHER;
}

} // namespace corebank::domain
