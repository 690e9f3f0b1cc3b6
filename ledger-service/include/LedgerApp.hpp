#pragma once

#include <memory>

namespace corebank::settings {
    class LedgerSettings;
    class PricingSettings;
    class DbSettings;
}

namespace corebank::adapters::primary {
    class LedgerCommandHandler;
}

/**
 * @class LedgerApp
 * @brief Главное приложение CoreBank Ledger
 *
 * Template Method:
 * 1. loadEnvironment() - настройки из переменных окружения
 * 2. configureInjection() - Boost.DI граф для выбранного хранилища
 * 3. execute() - одна команда из argv или сессия из stdin
 *
 * Архитектура: Hexagonal (Ports & Adapters)
 * - Primary Adapter: LedgerCommandHandler (CLI -> JSON)
 * - Secondary Adapters: Postgres* или InMemory* хранилища, NavPricingProvider
 */
class LedgerApp
{
public:
    LedgerApp();
    ~LedgerApp();

    /**
     * @return Код возврата процесса
     */
    int run(int argc, char* argv[]);

protected:
    void loadEnvironment();

    /**
     * @brief Собрать граф сервисов через Boost.DI
     *
     * Хранилище счетов одновременно реализует IAccountStore и IHoldingRepository,
     * оба порта привязаны к одному экземпляру.
     */
    void configureInjection();

    int execute(int argc, char* argv[]);

private:
    std::shared_ptr<corebank::settings::LedgerSettings> ledgerSettings_;
    std::shared_ptr<corebank::settings::PricingSettings> pricingSettings_;
    std::shared_ptr<corebank::settings::DbSettings> dbSettings_;
    std::shared_ptr<corebank::adapters::primary::LedgerCommandHandler> handler_;

    void configureInMemory();
    void configurePostgres();
};
