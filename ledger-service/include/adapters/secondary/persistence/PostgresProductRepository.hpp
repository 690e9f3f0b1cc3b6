#pragma once

#include "ports/output/IProductRepository.hpp"
#include "settings/DbSettings.hpp"
#include "domain/LedgerErrors.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace corebank::adapters::secondary {

/**
 * @brief PostgreSQL реализация каталога продуктов
 *
 * Таблица: investment_products
 * - id VARCHAR(64) PRIMARY KEY
 * - product_code VARCHAR(20) UNIQUE
 * - product_type VARCHAR(20) (money_fund, fixed_term, mutual_fund, insurance)
 * - min/max_investment_amount NUMERIC(19,4)
 * - investment_period_days INTEGER (только fixed_term)
 */
class PostgresProductRepository : public ports::output::IProductRepository {
public:
    explicit PostgresProductRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        initSchema();
    }

    void save(const domain::InvestmentProduct& product) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            std::optional<std::string> expectedReturn;
            if (product.expectedReturnRate) {
                expectedReturn = product.expectedReturnRate->toString(4);
            }
            std::optional<std::string> maxAmount;
            if (product.maxInvestmentAmount) {
                maxAmount = product.maxInvestmentAmount->toString(4);
            }

            txn.exec_params(
                "INSERT INTO investment_products "
                "(id, product_code, name, product_type, risk_level, expected_return_rate, "
                " min_investment_amount, max_investment_amount, investment_period_days, is_active) "
                "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10) "
                "ON CONFLICT (id) DO UPDATE SET "
                "name = EXCLUDED.name, "
                "risk_level = EXCLUDED.risk_level, "
                "expected_return_rate = EXCLUDED.expected_return_rate, "
                "min_investment_amount = EXCLUDED.min_investment_amount, "
                "max_investment_amount = EXCLUDED.max_investment_amount, "
                "investment_period_days = EXCLUDED.investment_period_days, "
                "is_active = EXCLUDED.is_active, "
                "updated_at = NOW()",
                product.id,
                product.code,
                product.name,
                domain::toString(product.type),
                product.riskLevel,
                expectedReturn,
                product.minInvestmentAmount.toString(4),
                maxAmount,
                product.investmentPeriodDays,
                product.active
            );

            txn.commit();
            std::clog << "[PostgresProductRepository] Saved product " << product.code << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresProductRepository] save error: " << e.what() << std::endl;
            throw domain::StoreFailureException(std::string("save product: ") + e.what());
        }
    }

    std::optional<domain::InvestmentProduct> findById(const std::string& productId) override {
        return findOne("id", productId);
    }

    std::optional<domain::InvestmentProduct> findByCode(const std::string& code) override {
        return findOne("product_code", code);
    }

    std::vector<domain::InvestmentProduct> findActive() override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec(std::string("SELECT ") + COLUMNS +
                " FROM investment_products WHERE is_active ORDER BY risk_level, product_code");

            std::vector<domain::InvestmentProduct> products;
            for (const auto& row : result) {
                products.push_back(toProduct(row));
            }
            return products;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresProductRepository] findActive error: " << e.what() << std::endl;
            throw domain::StoreFailureException(std::string("find products: ") + e.what());
        }
    }

private:
    static constexpr const char* COLUMNS =
        "id, product_code, name, product_type, risk_level, "
        "expected_return_rate::text AS expected_return_rate, "
        "min_investment_amount::text AS min_investment_amount, "
        "max_investment_amount::text AS max_investment_amount, "
        "investment_period_days, is_active";

    std::shared_ptr<settings::DbSettings> settings_;

    std::optional<domain::InvestmentProduct> findOne(const std::string& column, const std::string& value) {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                std::string("SELECT ") + COLUMNS + " FROM investment_products WHERE " + column + " = $1",
                value
            );

            if (result.empty()) {
                return std::nullopt;
            }
            return toProduct(result[0]);

        } catch (const std::exception& e) {
            std::cerr << "[PostgresProductRepository] find error: " << e.what() << std::endl;
            throw domain::StoreFailureException(std::string("find product: ") + e.what());
        }
    }

    static domain::InvestmentProduct toProduct(const pqxx::row& row) {
        domain::InvestmentProduct product;
        product.id = row["id"].as<std::string>();
        product.code = row["product_code"].as<std::string>();
        product.name = row["name"].as<std::string>();
        product.type = domain::productTypeFromString(row["product_type"].as<std::string>());
        product.riskLevel = row["risk_level"].as<int>();
        if (!row["expected_return_rate"].is_null()) {
            product.expectedReturnRate = domain::Decimal::parse(row["expected_return_rate"].as<std::string>());
        }
        product.minInvestmentAmount = domain::Decimal::parse(row["min_investment_amount"].as<std::string>());
        if (!row["max_investment_amount"].is_null()) {
            product.maxInvestmentAmount = domain::Decimal::parse(row["max_investment_amount"].as<std::string>());
        }
        if (!row["investment_period_days"].is_null()) {
            product.investmentPeriodDays = row["investment_period_days"].as<int>();
        }
        product.active = row["is_active"].as<bool>();
        return product;
    }

    void initSchema() {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS investment_products (
                    id VARCHAR(64) PRIMARY KEY,
                    product_code VARCHAR(20) NOT NULL UNIQUE,
                    name VARCHAR(100) NOT NULL,
                    product_type VARCHAR(20) NOT NULL,
                    risk_level INTEGER NOT NULL CHECK (risk_level BETWEEN 1 AND 5),
                    expected_return_rate NUMERIC(8,4),
                    min_investment_amount NUMERIC(19,4) NOT NULL DEFAULT 1.00,
                    max_investment_amount NUMERIC(19,4),
                    investment_period_days INTEGER,
                    is_active BOOLEAN NOT NULL DEFAULT TRUE,
                    created_at TIMESTAMP DEFAULT NOW(),
                    updated_at TIMESTAMP DEFAULT NOW()
                )
            )");

            txn.commit();
            std::clog << "[PostgresProductRepository] Schema initialized" << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresProductRepository] initSchema error: " << e.what() << std::endl;
            throw domain::StoreFailureException(std::string("init investment_products: ") + e.what());
        }
    }
};

} // namespace corebank::adapters::secondary
