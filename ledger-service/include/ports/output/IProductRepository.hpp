#pragma once

#include "domain/InvestmentProduct.hpp"
#include <optional>
#include <string>
#include <vector>

namespace corebank::ports::output {

/**
 * @brief Каталог инвестиционных продуктов
 */
class IProductRepository {
public:
    virtual ~IProductRepository() = default;

    virtual void save(const domain::InvestmentProduct& product) = 0;

    virtual std::optional<domain::InvestmentProduct> findById(const std::string& productId) = 0;

    virtual std::optional<domain::InvestmentProduct> findByCode(const std::string& code) = 0;

    virtual std::vector<domain::InvestmentProduct> findActive() = 0;
};

} // namespace corebank::ports::output
