#pragma once

#include "domain/Decimal.hpp"
#include "domain/InvestmentProduct.hpp"
#include "domain/InvestmentTransaction.hpp"
#include "domain/NavRecord.hpp"
#include "domain/Portfolio.hpp"
#include "domain/enums/InvestmentTransactionKind.hpp"
#include <optional>
#include <string>
#include <vector>

namespace corebank::ports::input {

/**
 * @brief Интерфейс сервиса инвестиций
 *
 * Input Port для покупки и погашения паёв и просмотра портфеля.
 */
class IInvestmentService {
public:
    virtual ~IInvestmentService() = default;

    /**
     * @brief Купить паи продукта за amount со счёта пользователя
     *
     * Со счёта списывается вся сумма, комиссия не превращается в паи.
     *
     * @throws NotFoundException продукт не найден/неактивен, счёт чужой, цены нет
     * @throws ValidationException сумма вне [min, max] продукта
     * @throws InsufficientFundsException баланса не хватает
     */
    virtual domain::InvestmentTransaction purchase(
        const std::string& userId,
        const std::string& accountId,
        const std::string& productId,
        const domain::Decimal& amount
    ) = 0;

    /**
     * @brief Погасить паи позиции
     *
     * @param shares nullopt = все паи позиции
     * @throws NotFoundException позиция не найдена или чужая
     * @throws BusinessRuleException позиция не ACTIVE
     * @throws ValidationException паёв больше, чем в позиции
     */
    virtual domain::InvestmentTransaction redeem(
        const std::string& userId,
        const std::string& holdingId,
        const std::optional<domain::Decimal>& shares
    ) = 0;

    virtual std::vector<domain::HoldingView> getHoldings(const std::string& userId) = 0;

    virtual domain::PortfolioSummary getPortfolioSummary(const std::string& userId) = 0;

    virtual std::vector<domain::InvestmentTransaction> getInvestmentTransactions(
        const std::string& userId,
        const std::optional<std::string>& productId,
        const std::optional<domain::InvestmentTransactionKind>& kind,
        int skip,
        int limit
    ) = 0;

    // Каталог

    virtual domain::InvestmentProduct addProduct(const domain::InvestmentProduct& product) = 0;

    virtual std::vector<domain::InvestmentProduct> getProducts() = 0;

    virtual void publishNav(const domain::NavRecord& record) = 0;
};

} // namespace corebank::ports::input
