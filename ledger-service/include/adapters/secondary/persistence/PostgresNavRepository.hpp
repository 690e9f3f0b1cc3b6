#pragma once

#include "ports/output/INavRepository.hpp"
#include "settings/DbSettings.hpp"
#include "domain/LedgerErrors.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace corebank::adapters::secondary {

/**
 * @brief PostgreSQL реализация истории NAV
 *
 * Таблица: product_nav_history, UNIQUE (product_id, nav_date)
 */
class PostgresNavRepository : public ports::output::INavRepository {
public:
    explicit PostgresNavRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        initSchema();
    }

    void save(const domain::NavRecord& record) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec_params(
                "INSERT INTO product_nav_history (product_id, nav_date, unit_nav) "
                "VALUES ($1, $2::date, $3) "
                "ON CONFLICT (product_id, nav_date) DO UPDATE SET unit_nav = EXCLUDED.unit_nav",
                record.productId,
                record.date,
                record.unitPrice.toString(4)
            );

            txn.commit();
            std::clog << "[PostgresNavRepository] NAV " << record.productId << " @ " << record.date
                      << " = " << record.unitPrice.toString(4) << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresNavRepository] save error: " << e.what() << std::endl;
            throw domain::StoreFailureException(std::string("save nav: ") + e.what());
        }
    }

    std::optional<domain::NavRecord> findLatest(const std::string& productId) override {
        auto history = findHistory(productId, 1);
        if (history.empty()) {
            return std::nullopt;
        }
        return history.front();
    }

    std::vector<domain::NavRecord> findHistory(const std::string& productId, int limit) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT product_id, nav_date::text AS nav_date, unit_nav::text AS unit_nav "
                "FROM product_nav_history WHERE product_id = $1 "
                "ORDER BY nav_date DESC LIMIT $2",
                productId,
                limit
            );

            std::vector<domain::NavRecord> records;
            for (const auto& row : result) {
                domain::NavRecord record;
                record.productId = row["product_id"].as<std::string>();
                record.date = row["nav_date"].as<std::string>();
                record.unitPrice = domain::Decimal::parse(row["unit_nav"].as<std::string>());
                records.push_back(record);
            }
            return records;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresNavRepository] findHistory error: " << e.what() << std::endl;
            throw domain::StoreFailureException(std::string("find nav: ") + e.what());
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    void initSchema() {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS product_nav_history (
                    id BIGSERIAL PRIMARY KEY,
                    product_id VARCHAR(64) NOT NULL,
                    nav_date DATE NOT NULL,
                    unit_nav NUMERIC(19,4) NOT NULL CHECK (unit_nav > 0),
                    created_at TIMESTAMP DEFAULT NOW(),
                    UNIQUE (product_id, nav_date)
                )
            )");

            txn.commit();
            std::clog << "[PostgresNavRepository] Schema initialized" << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresNavRepository] initSchema error: " << e.what() << std::endl;
            throw domain::StoreFailureException(std::string("init product_nav_history: ") + e.what());
        }
    }
};

} // namespace corebank::adapters::secondary
