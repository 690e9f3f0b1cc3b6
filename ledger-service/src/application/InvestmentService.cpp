#include "application/InvestmentService.hpp"
#include "application/FeeSchedule.hpp"
#include "application/HoldingValuator.hpp"
#include "domain/LedgerErrors.hpp"
#include "utils/UuidGenerator.hpp"

#include <cctype>
#include <iostream>
#include <map>

namespace corebank::application {

namespace {

bool isIsoDate(const std::string& date) {
    if (date.size() != 10 || date[4] != '-' || date[7] != '-') {
        return false;
    }
    for (size_t i = 0; i < date.size(); ++i) {
        if (i == 4 || i == 7) continue;
        if (!std::isdigit(static_cast<unsigned char>(date[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace

InvestmentService::InvestmentService(
    std::shared_ptr<LedgerEngine> engine,
    std::shared_ptr<ports::output::IAccountStore> accountStore,
    std::shared_ptr<ports::output::IHoldingRepository> holdingRepository,
    std::shared_ptr<ports::output::IProductRepository> productRepository,
    std::shared_ptr<ports::output::INavRepository> navRepository,
    std::shared_ptr<ports::output::IPricingProvider> pricingProvider)
    : engine_(std::move(engine))
    , accountStore_(std::move(accountStore))
    , holdingRepository_(std::move(holdingRepository))
    , productRepository_(std::move(productRepository))
    , navRepository_(std::move(navRepository))
    , pricingProvider_(std::move(pricingProvider))
{
    std::clog << "[InvestmentService] Created" << std::endl;
}

domain::Decimal InvestmentService::requirePrice(const std::string& productId) {
    auto price = pricingProvider_->getCurrentUnitPrice(productId);
    if (!price || !price->isPositive()) {
        throw domain::NotFoundException("No unit price available for product " + productId);
    }
    return price->quantize(domain::Decimal::MONEY_SCALE);
}

// ============================================
// PURCHASE
// ============================================

domain::InvestmentTransaction InvestmentService::purchase(
    const std::string& userId,
    const std::string& accountId,
    const std::string& productId,
    const domain::Decimal& amount)
{
    constexpr int money = domain::Decimal::MONEY_SCALE;
    constexpr int sharesScale = domain::Decimal::SHARES_SCALE;

    auto gross = amount.quantize(money);
    if (!gross.isPositive()) {
        throw domain::ValidationException("Investment amount must be positive");
    }

    auto product = productRepository_->findById(productId);
    if (!product || !product->active) {
        throw domain::NotFoundException("Investment product not found or inactive");
    }
    if (gross < product->minInvestmentAmount) {
        throw domain::ValidationException(
            "Investment amount must be at least " + product->minInvestmentAmount.toString());
    }
    if (product->maxInvestmentAmount && gross > *product->maxInvestmentAmount) {
        throw domain::ValidationException(
            "Investment amount cannot exceed " + product->maxInvestmentAmount->toString());
    }

    // Цена до начала единицы работы: блокировки не держатся во время запроса
    auto unitPrice = requirePrice(productId);

    auto fee = FeeSchedule::purchaseFee(product->type, gross);
    auto net = gross - fee;
    auto shares = domain::Decimal::divide(net, unitPrice).quantize(sharesScale);
    if (!shares.isPositive()) {
        throw domain::ValidationException("Investment amount is too small to buy any shares");
    }

    auto unitOfWork = accountStore_->beginUnitOfWork();
    try {
        auto account = unitOfWork->getAccountForUpdate(accountId);
        if (!account || account->ownerId != userId) {
            throw domain::NotFoundException("Account not found or not owned by user");
        }
        if (account->balance < gross) {
            throw domain::InsufficientFundsException("Insufficient account balance");
        }

        auto existing = unitOfWork->findActiveHoldingForUpdate(userId, productId);

        std::string description = "Purchase " + product->name;
        auto ledger = engine_->applyBalancedTransaction(
            *unitOfWork,
            domain::TransactionKind::INVESTMENT_PURCHASE,
            {
                domain::EntryRequest::debit(accountId, gross, description),
                domain::EntryRequest::virtualLeg(domain::EntryType::CREDIT, gross, "Investment settlement")
            },
            description
        );

        auto now = domain::Timestamp::now();
        domain::InvestmentHolding holding;
        if (existing) {
            // Слияние по средневзвешенной цене; срок погашения не переносится
            holding = *existing;
            holding.shares = (holding.shares + shares).quantize(sharesScale);
            holding.totalInvested = (holding.totalInvested + net).quantize(money);
            holding.averageCost = domain::Decimal::divide(holding.totalInvested, holding.shares).quantize(money);
            unitOfWork->updateHolding(holding);
        } else {
            holding.id = utils::UuidGenerator::generate();
            holding.userId = userId;
            holding.accountId = accountId;
            holding.productId = productId;
            holding.shares = shares;
            holding.averageCost = unitPrice;
            holding.totalInvested = net;
            holding.purchaseDate = now;
            if (product->type == domain::ProductType::FIXED_TERM && product->investmentPeriodDays) {
                holding.maturityDate = now.addDays(*product->investmentPeriodDays);
            }
            holding.status = domain::HoldingStatus::ACTIVE;
            holding.createdAt = now;
            holding.updatedAt = now;
            unitOfWork->insertHolding(holding);
        }

        domain::InvestmentTransaction transaction;
        transaction.id = utils::UuidGenerator::generate();
        transaction.userId = userId;
        transaction.accountId = accountId;
        transaction.productId = productId;
        transaction.holdingId = holding.id;
        transaction.transactionGroupId = ledger.group.id;
        transaction.kind = domain::InvestmentTransactionKind::PURCHASE;
        transaction.shares = shares;
        transaction.unitPrice = unitPrice;
        transaction.grossAmount = gross;
        transaction.fee = fee;
        transaction.netAmount = net;
        transaction.status = domain::InvestmentTransactionStatus::CONFIRMED;
        transaction.description = description;
        transaction.settlementDate = now;
        transaction.createdAt = now;
        unitOfWork->insertInvestmentTransaction(transaction);

        unitOfWork->commit();

        std::clog << "[InvestmentService] Purchase " << gross.toString() << " of " << product->code
                  << " by " << userId << ": " << shares.toString(sharesScale) << " shares @ "
                  << unitPrice.toString() << ", fee " << fee.toString() << std::endl;
        return transaction;

    } catch (const domain::LedgerException& e) {
        unitOfWork->abort();
        std::cerr << "[InvestmentService] Purchase aborted (" << domain::toString(e.kind())
                  << "): " << e.what() << std::endl;
        throw;
    }
}

// ============================================
// REDEEM
// ============================================

domain::InvestmentTransaction InvestmentService::redeem(
    const std::string& userId,
    const std::string& holdingId,
    const std::optional<domain::Decimal>& shares)
{
    constexpr int money = domain::Decimal::MONEY_SCALE;
    constexpr int sharesScale = domain::Decimal::SHARES_SCALE;

    // Чтение без блокировки: только чтобы узнать продукт и счёт
    auto snapshot = holdingRepository_->findHoldingById(holdingId);
    if (!snapshot || snapshot->userId != userId) {
        throw domain::NotFoundException("Investment holding not found or not owned by user");
    }

    auto product = productRepository_->findById(snapshot->productId);
    if (!product) {
        throw domain::NotFoundException("Investment product not found: " + snapshot->productId);
    }

    std::optional<domain::Decimal> requested;
    if (shares) {
        requested = shares->quantize(sharesScale);
        if (!requested->isPositive()) {
            throw domain::ValidationException("Shares to redeem must be positive");
        }
    }

    auto unitPrice = requirePrice(snapshot->productId);

    auto unitOfWork = accountStore_->beginUnitOfWork();
    try {
        auto account = unitOfWork->getAccountForUpdate(snapshot->accountId);
        if (!account) {
            throw domain::NotFoundException("Account not found: " + snapshot->accountId);
        }

        auto holding = unitOfWork->getHoldingForUpdate(holdingId);
        if (!holding || holding->userId != userId) {
            throw domain::NotFoundException("Investment holding not found or not owned by user");
        }
        if (!holding->isActive()) {
            throw domain::BusinessRuleException("Cannot redeem inactive holding");
        }

        auto sharesToRedeem = requested.value_or(holding->shares);
        if (sharesToRedeem > holding->shares) {
            throw domain::ValidationException("Cannot redeem more shares than held");
        }

        auto gross = domain::Decimal::multiply(sharesToRedeem, unitPrice).quantize(money);
        auto fee = FeeSchedule::redemptionFee(product->type, gross);
        auto net = gross - fee;

        std::string description = "Redeem " + product->name;
        std::optional<std::string> groupId;
        if (net.isPositive()) {
            auto ledger = engine_->applyBalancedTransaction(
                *unitOfWork,
                domain::TransactionKind::INVESTMENT_REDEMPTION,
                {
                    domain::EntryRequest::credit(holding->accountId, net, description),
                    domain::EntryRequest::virtualLeg(domain::EntryType::DEBIT, net, "Investment settlement")
                },
                description
            );
            groupId = ledger.group.id;
        }

        auto remaining = holding->shares - sharesToRedeem;
        if (remaining.isZero()) {
            // Полное погашение: позиция закрывается, паи остаются как были
            holding->status = domain::HoldingStatus::REDEEMED;
        } else {
            // Частичное: averageCost и totalInvested не пересчитываются
            holding->shares = remaining;
        }
        unitOfWork->updateHolding(*holding);

        auto now = domain::Timestamp::now();
        domain::InvestmentTransaction transaction;
        transaction.id = utils::UuidGenerator::generate();
        transaction.userId = userId;
        transaction.accountId = holding->accountId;
        transaction.productId = holding->productId;
        transaction.holdingId = holding->id;
        transaction.transactionGroupId = groupId;
        transaction.kind = domain::InvestmentTransactionKind::REDEMPTION;
        transaction.shares = sharesToRedeem;
        transaction.unitPrice = unitPrice;
        transaction.grossAmount = gross;
        transaction.fee = fee;
        transaction.netAmount = net;
        transaction.status = domain::InvestmentTransactionStatus::CONFIRMED;
        transaction.description = description;
        transaction.settlementDate = now;
        transaction.createdAt = now;
        unitOfWork->insertInvestmentTransaction(transaction);

        unitOfWork->commit();

        std::clog << "[InvestmentService] Redeem " << sharesToRedeem.toString(sharesScale) << " shares of "
                  << product->code << " by " << userId << ": net " << net.toString()
                  << (remaining.isZero() ? " (holding redeemed)" : "") << std::endl;
        return transaction;

    } catch (const domain::LedgerException& e) {
        unitOfWork->abort();
        std::cerr << "[InvestmentService] Redemption aborted (" << domain::toString(e.kind())
                  << "): " << e.what() << std::endl;
        throw;
    }
}

// ============================================
// PORTFOLIO
// ============================================

std::vector<domain::HoldingView> InvestmentService::getHoldings(const std::string& userId) {
    std::vector<domain::HoldingView> views;
    for (const auto& holding : holdingRepository_->findHoldingsByUserId(userId)) {
        domain::HoldingView view;
        view.holding = holding;

        auto product = productRepository_->findById(holding.productId);
        if (product) {
            view.product = *product;
        } else {
            view.product.id = holding.productId;
            view.product.type = domain::ProductType::OTHER;
        }

        // Без цены позиция оценивается по своей средней цене
        auto price = pricingProvider_->getCurrentUnitPrice(holding.productId);
        view.valuation = HoldingValuator::valuate(holding, price.value_or(holding.averageCost));

        views.push_back(view);
    }
    return views;
}

domain::PortfolioSummary InvestmentService::getPortfolioSummary(const std::string& userId) {
    auto holdings = getHoldings(userId);

    domain::PortfolioSummary summary;
    summary.holdingsCount = static_cast<int64_t>(holdings.size());

    std::map<std::string, domain::Decimal> valueByType;
    for (const auto& view : holdings) {
        if (!view.holding.isActive()) {
            continue;
        }
        ++summary.activeProductsCount;
        summary.totalAssets += view.valuation.currentValue;
        summary.totalInvested += view.holding.totalInvested;
        valueByType[domain::toString(view.product.type)] += view.valuation.currentValue;
    }

    summary.totalGainLoss = summary.totalAssets - summary.totalInvested;
    summary.totalReturnRate = HoldingValuator::percentOf(summary.totalGainLoss, summary.totalInvested);

    for (const auto& [type, value] : valueByType) {
        summary.assetAllocation[type] = summary.totalAssets.isPositive()
            ? HoldingValuator::percentOf(value, summary.totalAssets)
            : value;
    }
    return summary;
}

std::vector<domain::InvestmentTransaction> InvestmentService::getInvestmentTransactions(
    const std::string& userId,
    const std::optional<std::string>& productId,
    const std::optional<domain::InvestmentTransactionKind>& kind,
    int skip,
    int limit)
{
    if (skip < 0) {
        throw domain::ValidationException("skip must not be negative");
    }
    if (limit < 1 || limit > 1000) {
        throw domain::ValidationException("limit must be between 1 and 1000");
    }
    return holdingRepository_->findInvestmentTransactionsByUserId(userId, productId, kind, limit, skip);
}

// ============================================
// CATALOG
// ============================================

domain::InvestmentProduct InvestmentService::addProduct(const domain::InvestmentProduct& product) {
    if (product.code.empty() || product.name.empty()) {
        throw domain::ValidationException("Product code and name are required");
    }
    if (product.riskLevel < 1 || product.riskLevel > 5) {
        throw domain::ValidationException("Risk level must be between 1 and 5");
    }
    if (!product.minInvestmentAmount.isPositive()) {
        throw domain::ValidationException("Minimum investment amount must be positive");
    }
    if (product.maxInvestmentAmount && *product.maxInvestmentAmount < product.minInvestmentAmount) {
        throw domain::ValidationException("Maximum investment amount is below the minimum");
    }
    if (product.investmentPeriodDays && *product.investmentPeriodDays <= 0) {
        throw domain::ValidationException("Investment period must be positive");
    }

    auto stored = product;
    if (stored.id.empty()) {
        stored.id = utils::UuidGenerator::generate();
    }
    stored.minInvestmentAmount = stored.minInvestmentAmount.quantize(domain::Decimal::MONEY_SCALE);
    productRepository_->save(stored);

    std::clog << "[InvestmentService] Product " << stored.code << " (" << domain::toString(stored.type)
              << ") registered as " << stored.id << std::endl;
    return stored;
}

std::vector<domain::InvestmentProduct> InvestmentService::getProducts() {
    return productRepository_->findActive();
}

void InvestmentService::publishNav(const domain::NavRecord& record) {
    if (!isIsoDate(record.date)) {
        throw domain::ValidationException("NAV date must be YYYY-MM-DD: " + record.date);
    }
    auto price = record.unitPrice.quantize(domain::Decimal::MONEY_SCALE);
    if (!price.isPositive()) {
        throw domain::ValidationException("Unit price must be positive");
    }
    if (!productRepository_->findById(record.productId)) {
        throw domain::NotFoundException("Investment product not found: " + record.productId);
    }

    auto stored = record;
    stored.unitPrice = price;
    navRepository_->save(stored);
}

} // namespace corebank::application
