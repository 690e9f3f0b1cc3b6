#include "LedgerApp.hpp"

// Primary Adapters
#include "adapters/primary/LedgerCommandHandler.hpp"

// Application Services
#include "application/AccountService.hpp"
#include "application/InvestmentService.hpp"
#include "application/LedgerAuditor.hpp"
#include "application/LedgerEngine.hpp"
#include "application/LedgerService.hpp"
#include "application/TransferOrchestrator.hpp"

// Secondary Adapters
#include "adapters/secondary/persistence/InMemoryAccountStore.hpp"
#include "adapters/secondary/persistence/InMemoryNavRepository.hpp"
#include "adapters/secondary/persistence/InMemoryProductRepository.hpp"
#include "adapters/secondary/persistence/PostgresAccountStore.hpp"
#include "adapters/secondary/persistence/PostgresNavRepository.hpp"
#include "adapters/secondary/persistence/PostgresProductRepository.hpp"
#include "adapters/secondary/pricing/NavPricingProvider.hpp"

// Settings
#include "settings/DbSettings.hpp"
#include "settings/LedgerSettings.hpp"
#include "settings/PricingSettings.hpp"

#include <boost/di.hpp>
#include <iostream>
#include <string>
#include <vector>

namespace di = boost::di;

using namespace corebank;

namespace {

// Общая часть графа: сервисы поверх уже привязанных портов хранения
template <typename Injector>
std::shared_ptr<adapters::primary::LedgerCommandHandler> createHandler(Injector& injector)
{
    return injector.template create<std::shared_ptr<adapters::primary::LedgerCommandHandler>>();
}

} // namespace

// ============================================================================
// LedgerApp Implementation
// ============================================================================

LedgerApp::LedgerApp()
{
    std::clog << "[LedgerApp] Application created" << std::endl;
}

LedgerApp::~LedgerApp()
{
    std::clog << "[LedgerApp] Application destroyed" << std::endl;
}

int LedgerApp::run(int argc, char* argv[])
{
    loadEnvironment();
    configureInjection();
    return execute(argc, argv);
}

void LedgerApp::loadEnvironment()
{
    std::clog << "[LedgerApp] Loading environment..." << std::endl;

    ledgerSettings_ = std::make_shared<settings::LedgerSettings>();
    pricingSettings_ = std::make_shared<settings::PricingSettings>();
    dbSettings_ = std::make_shared<settings::DbSettings>();

    std::clog << "[LedgerApp] Store backend: " << ledgerSettings_->getStore() << std::endl;
}

void LedgerApp::configureInjection()
{
    std::clog << "[LedgerApp] Configuring Boost.DI injection..." << std::endl;

    if (ledgerSettings_->useInMemoryStore()) {
        configureInMemory();
    } else {
        configurePostgres();
    }

    std::clog << "[LedgerApp] Injection configured" << std::endl;
}

void LedgerApp::configureInMemory()
{
    // Один экземпляр на оба порта: позиции и счета делят блокировки
    auto store = std::make_shared<adapters::secondary::InMemoryAccountStore>();

    auto injector = di::make_injector(

        // ====================================================================
        // Settings
        // ====================================================================

        di::bind<settings::LedgerSettings>().to(ledgerSettings_),
        di::bind<settings::PricingSettings>().to(pricingSettings_),

        // ====================================================================
        // Secondary Adapters (Output Ports)
        // ====================================================================

        di::bind<ports::output::IAccountStore>().to(store),
        di::bind<ports::output::IHoldingRepository>().to(store),

        di::bind<ports::output::IProductRepository>()
            .to<adapters::secondary::InMemoryProductRepository>()
            .in(di::singleton),

        di::bind<ports::output::INavRepository>()
            .to<adapters::secondary::InMemoryNavRepository>()
            .in(di::singleton),

        di::bind<ports::output::IPricingProvider>()
            .to<adapters::secondary::NavPricingProvider>()
            .in(di::singleton),

        // ====================================================================
        // Application Services (Input Ports)
        // ====================================================================

        di::bind<application::LedgerEngine>().in(di::singleton),
        di::bind<application::TransferOrchestrator>().in(di::singleton),
        di::bind<application::LedgerAuditor>().in(di::singleton),

        di::bind<ports::input::ILedgerService>()
            .to<application::LedgerService>()
            .in(di::singleton),

        di::bind<ports::input::IAccountService>()
            .to<application::AccountService>()
            .in(di::singleton),

        di::bind<ports::input::IInvestmentService>()
            .to<application::InvestmentService>()
            .in(di::singleton)
    );

    handler_ = createHandler(injector);
}

void LedgerApp::configurePostgres()
{
    auto store = std::make_shared<adapters::secondary::PostgresAccountStore>(dbSettings_);

    auto injector = di::make_injector(

        // ====================================================================
        // Settings
        // ====================================================================

        di::bind<settings::LedgerSettings>().to(ledgerSettings_),
        di::bind<settings::PricingSettings>().to(pricingSettings_),
        di::bind<settings::DbSettings>().to(dbSettings_),

        // ====================================================================
        // Secondary Adapters (Output Ports)
        // ====================================================================

        di::bind<ports::output::IAccountStore>().to(store),
        di::bind<ports::output::IHoldingRepository>().to(store),

        di::bind<ports::output::IProductRepository>()
            .to<adapters::secondary::PostgresProductRepository>()
            .in(di::singleton),

        di::bind<ports::output::INavRepository>()
            .to<adapters::secondary::PostgresNavRepository>()
            .in(di::singleton),

        di::bind<ports::output::IPricingProvider>()
            .to<adapters::secondary::NavPricingProvider>()
            .in(di::singleton),

        // ====================================================================
        // Application Services (Input Ports)
        // ====================================================================

        di::bind<application::LedgerEngine>().in(di::singleton),
        di::bind<application::TransferOrchestrator>().in(di::singleton),
        di::bind<application::LedgerAuditor>().in(di::singleton),

        di::bind<ports::input::ILedgerService>()
            .to<application::LedgerService>()
            .in(di::singleton),

        di::bind<ports::input::IAccountService>()
            .to<application::AccountService>()
            .in(di::singleton),

        di::bind<ports::input::IInvestmentService>()
            .to<application::InvestmentService>()
            .in(di::singleton)
    );

    handler_ = createHandler(injector);
}

int LedgerApp::execute(int argc, char* argv[])
{
    if (argc > 1) {
        std::vector<std::string> args(argv + 1, argv + argc);
        return handler_->handle(args, std::cout);
    }

    std::clog << "[LedgerApp] Reading commands from stdin" << std::endl;
    return handler_->runSession(std::cin, std::cout);
}
