#pragma once

#include "Decimal.hpp"
#include <string>

namespace corebank::domain {

/**
 * @brief Стоимость пая продукта на дату
 *
 * Одна запись на (productId, date). Актуальная цена = запись с максимальной датой.
 */
struct NavRecord {
    std::string productId;
    std::string date;       ///< "YYYY-MM-DD"
    Decimal unitPrice;      ///< > 0
};

} // namespace corebank::domain
