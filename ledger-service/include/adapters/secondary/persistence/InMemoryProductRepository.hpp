#pragma once

#include "ports/output/IProductRepository.hpp"
#include "domain/LedgerErrors.hpp"
#include <ThreadSafeMap.hpp>
#include <algorithm>

namespace corebank::adapters::secondary {

/**
 * @brief In-memory реализация каталога продуктов
 */
class InMemoryProductRepository : public ports::output::IProductRepository {
public:
    void save(const domain::InvestmentProduct& product) override {
        auto sameCode = findByCode(product.code);
        if (sameCode && sameCode->id != product.id) {
            throw domain::BusinessRuleException("Product code already exists: " + product.code);
        }
        products_.insert(product.id, std::make_shared<domain::InvestmentProduct>(product));
    }

    std::optional<domain::InvestmentProduct> findById(const std::string& productId) override {
        auto product = products_.find(productId);
        if (product) {
            return *product;
        }
        return std::nullopt;
    }

    std::optional<domain::InvestmentProduct> findByCode(const std::string& code) override {
        for (const auto& product : products_.getAll()) {
            if (product->code == code) {
                return *product;
            }
        }
        return std::nullopt;
    }

    std::vector<domain::InvestmentProduct> findActive() override {
        std::vector<domain::InvestmentProduct> result;
        for (const auto& product : products_.getAll()) {
            if (product->active) {
                result.push_back(*product);
            }
        }
        std::sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
            return a.riskLevel != b.riskLevel ? a.riskLevel < b.riskLevel : a.code < b.code;
        });
        return result;
    }

private:
    ThreadSafeMap<std::string, domain::InvestmentProduct> products_;
};

} // namespace corebank::adapters::secondary
