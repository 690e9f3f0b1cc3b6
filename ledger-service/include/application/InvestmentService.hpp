#pragma once

#include "application/LedgerEngine.hpp"
#include "ports/input/IInvestmentService.hpp"
#include "ports/output/IAccountStore.hpp"
#include "ports/output/IHoldingRepository.hpp"
#include "ports/output/INavRepository.hpp"
#include "ports/output/IPricingProvider.hpp"
#include "ports/output/IProductRepository.hpp"
#include <memory>

namespace corebank::application {

/**
 * @brief Сервис инвестиций: деньги <-> паи по текущей цене
 *
 * Покупка и погашение выполняются одной единицей работы: проводки по счёту
 * (через LedgerEngine), изменение позиции и запись операции фиксируются вместе.
 * Цена запрашивается до начала единицы работы.
 *
 * Порядок блокировок: счёт, затем позиция.
 */
class InvestmentService : public ports::input::IInvestmentService {
public:
    InvestmentService(
        std::shared_ptr<LedgerEngine> engine,
        std::shared_ptr<ports::output::IAccountStore> accountStore,
        std::shared_ptr<ports::output::IHoldingRepository> holdingRepository,
        std::shared_ptr<ports::output::IProductRepository> productRepository,
        std::shared_ptr<ports::output::INavRepository> navRepository,
        std::shared_ptr<ports::output::IPricingProvider> pricingProvider
    );

    domain::InvestmentTransaction purchase(
        const std::string& userId,
        const std::string& accountId,
        const std::string& productId,
        const domain::Decimal& amount
    ) override;

    domain::InvestmentTransaction redeem(
        const std::string& userId,
        const std::string& holdingId,
        const std::optional<domain::Decimal>& shares
    ) override;

    std::vector<domain::HoldingView> getHoldings(const std::string& userId) override;

    domain::PortfolioSummary getPortfolioSummary(const std::string& userId) override;

    std::vector<domain::InvestmentTransaction> getInvestmentTransactions(
        const std::string& userId,
        const std::optional<std::string>& productId,
        const std::optional<domain::InvestmentTransactionKind>& kind,
        int skip,
        int limit
    ) override;

    domain::InvestmentProduct addProduct(const domain::InvestmentProduct& product) override;

    std::vector<domain::InvestmentProduct> getProducts() override;

    void publishNav(const domain::NavRecord& record) override;

private:
    domain::Decimal requirePrice(const std::string& productId);

    std::shared_ptr<LedgerEngine> engine_;
    std::shared_ptr<ports::output::IAccountStore> accountStore_;
    std::shared_ptr<ports::output::IHoldingRepository> holdingRepository_;
    std::shared_ptr<ports::output::IProductRepository> productRepository_;
    std::shared_ptr<ports::output::INavRepository> navRepository_;
    std::shared_ptr<ports::output::IPricingProvider> pricingProvider_;
};

} // namespace corebank::application
