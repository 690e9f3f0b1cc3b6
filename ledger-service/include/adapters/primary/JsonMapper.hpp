#pragma once

#include "domain/Account.hpp"
#include "domain/AccountReports.hpp"
#include "domain/AuditReport.hpp"
#include "domain/InvestmentProduct.hpp"
#include "domain/InvestmentTransaction.hpp"
#include "domain/MovementRecord.hpp"
#include "domain/NavRecord.hpp"
#include "domain/Portfolio.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace corebank::adapters::primary {

/**
 * @brief Преобразование доменных объектов в JSON для CLI
 *
 * Суммы выводятся строками с фиксированным числом знаков,
 * чтобы не терять точность на double.
 */
class JsonMapper {
public:
    using json = nlohmann::json;

    static json money(const domain::Decimal& value) {
        return value.toString(domain::Decimal::MONEY_SCALE);
    }

    static json shares(const domain::Decimal& value) {
        return value.toString(domain::Decimal::SHARES_SCALE);
    }

    template <typename T>
    static json nullable(const std::optional<T>& value) {
        return value ? json(*value) : json(nullptr);
    }

    static json toJson(const domain::Account& account) {
        json j;
        j["id"] = account.id;
        j["account_number"] = account.number;
        j["owner_id"] = account.ownerId;
        j["account_type"] = domain::toString(account.type);
        j["balance"] = money(account.balance);
        j["created_at"] = account.createdAt.toString();
        j["updated_at"] = account.updatedAt.toString();
        return j;
    }

    static json toJson(const domain::MovementRecord& movement) {
        json j;
        j["transaction_group_id"] = movement.groupId;
        j["entry_id"] = movement.entryId;
        j["account_id"] = movement.accountId;
        j["transaction_type"] = domain::toString(movement.kind);
        j["entry_type"] = domain::toString(movement.entryType);
        j["amount"] = money(movement.amount);
        j["balance_after"] = money(movement.balanceAfter);
        j["description"] = movement.description;
        j["status"] = domain::toString(movement.status);
        j["created_at"] = movement.createdAt.toString();
        if (movement.relatedAccountId) {
            j["related_account_id"] = *movement.relatedAccountId;
        }
        return j;
    }

    static json toJson(const domain::TransactionEntry& entry) {
        json j;
        j["id"] = entry.id;
        j["transaction_group_id"] = entry.groupId;
        j["account_id"] = nullable(entry.accountId);
        j["entry_type"] = domain::toString(entry.entryType);
        j["amount"] = money(entry.amount);
        j["balance_after"] = entry.balanceAfter ? money(*entry.balanceAfter) : json(nullptr);
        j["description"] = entry.description;
        j["created_at"] = entry.createdAt.toString();
        return j;
    }

    static json toJson(const domain::BalancedTransaction& transaction) {
        json j;
        j["id"] = transaction.group.id;
        j["transaction_type"] = domain::toString(transaction.group.kind);
        j["description"] = transaction.group.description;
        j["total_amount"] = money(transaction.group.totalAmount);
        j["status"] = domain::toString(transaction.group.status);
        j["created_at"] = transaction.group.createdAt.toString();
        j["entries"] = json::array();
        for (const auto& entry : transaction.entries) {
            j["entries"].push_back(toJson(entry));
        }
        return j;
    }

    static json toJson(const domain::AccountHistoryPage& page) {
        json j;
        j["total"] = page.totalCount;
        j["page"] = page.page;
        j["page_size"] = page.pageSize;
        j["entries"] = json::array();
        for (const auto& entry : page.entries) {
            j["entries"].push_back(toJson(entry));
        }
        return j;
    }

    static json toJson(const domain::TransactionSummary& summary) {
        json j;
        j["account_id"] = summary.accountId;
        j["total_transactions"] = summary.totalTransactions;
        j["transaction_counts"] = summary.countsByKind;
        j["total_deposits"] = money(summary.totalDeposits);
        j["total_withdrawals"] = money(summary.totalWithdrawals);
        j["total_transfers_in"] = money(summary.totalTransfersIn);
        j["total_transfers_out"] = money(summary.totalTransfersOut);
        return j;
    }

    static json toJson(const domain::AccountSummary& summary) {
        return {
            {"total_accounts", summary.totalAccounts},
            {"total_balance", money(summary.totalBalance)},
            {"checking_accounts", summary.checkingAccounts},
            {"savings_accounts", summary.savingsAccounts}
        };
    }

    static json toJson(const domain::InvestmentProduct& product) {
        json j;
        j["id"] = product.id;
        j["product_code"] = product.code;
        j["name"] = product.name;
        j["product_type"] = domain::toString(product.type);
        j["risk_level"] = product.riskLevel;
        j["expected_return_rate"] = product.expectedReturnRate
            ? money(*product.expectedReturnRate) : json(nullptr);
        j["min_investment_amount"] = money(product.minInvestmentAmount);
        j["max_investment_amount"] = product.maxInvestmentAmount
            ? money(*product.maxInvestmentAmount) : json(nullptr);
        j["investment_period_days"] = nullable(product.investmentPeriodDays);
        j["is_active"] = product.active;
        return j;
    }

    static json toJson(const domain::InvestmentTransaction& txn) {
        json j;
        j["id"] = txn.id;
        j["user_id"] = txn.userId;
        j["account_id"] = txn.accountId;
        j["product_id"] = txn.productId;
        j["holding_id"] = nullable(txn.holdingId);
        j["transaction_group_id"] = nullable(txn.transactionGroupId);
        j["transaction_type"] = domain::toString(txn.kind);
        j["shares"] = shares(txn.shares);
        j["unit_price"] = money(txn.unitPrice);
        j["amount"] = money(txn.grossAmount);
        j["fee"] = money(txn.fee);
        j["net_amount"] = money(txn.netAmount);
        j["status"] = domain::toString(txn.status);
        j["description"] = txn.description;
        j["settlement_date"] = txn.settlementDate.toString();
        j["created_at"] = txn.createdAt.toString();
        return j;
    }

    static json toJson(const domain::HoldingView& view) {
        const auto& h = view.holding;
        json j;
        j["id"] = h.id;
        j["account_id"] = h.accountId;
        j["product_id"] = h.productId;
        j["product_code"] = view.product.code;
        j["product_name"] = view.product.name;
        j["product_type"] = domain::toString(view.product.type);
        j["shares"] = shares(h.shares);
        j["average_cost"] = money(h.averageCost);
        j["total_invested"] = money(h.totalInvested);
        j["realized_gain_loss"] = money(h.realizedGainLoss);
        j["unit_price"] = money(view.valuation.unitPrice);
        j["current_value"] = money(view.valuation.currentValue);
        j["unrealized_gain_loss"] = money(view.valuation.unrealizedGainLoss);
        j["return_rate"] = money(view.valuation.returnRate);
        j["purchase_date"] = h.purchaseDate.toString();
        j["maturity_date"] = h.maturityDate ? json(h.maturityDate->toString()) : json(nullptr);
        j["status"] = domain::toString(h.status);
        return j;
    }

    static json toJson(const domain::PortfolioSummary& summary) {
        json allocation = json::object();
        for (const auto& [type, percent] : summary.assetAllocation) {
            allocation[type] = money(percent);
        }

        json j;
        j["total_assets"] = money(summary.totalAssets);
        j["total_invested"] = money(summary.totalInvested);
        j["total_gain_loss"] = money(summary.totalGainLoss);
        j["total_return_rate"] = money(summary.totalReturnRate);
        j["asset_allocation"] = allocation;
        j["holdings_count"] = summary.holdingsCount;
        j["active_products_count"] = summary.activeProductsCount;
        return j;
    }

    static json toJson(const domain::NavRecord& record) {
        return {
            {"product_id", record.productId},
            {"nav_date", record.date},
            {"unit_price", money(record.unitPrice)}
        };
    }

    static json toJson(const domain::AuditReport& report) {
        json j;
        j["clean"] = report.clean();
        j["groups_checked"] = report.groupsChecked;
        j["entries_checked"] = report.entriesChecked;
        j["accounts_checked"] = report.accountsChecked;
        j["imbalanced_groups"] = json::array();
        for (const auto& group : report.imbalancedGroups) {
            j["imbalanced_groups"].push_back({
                {"transaction_group_id", group.groupId},
                {"debits", money(group.debits)},
                {"credits", money(group.credits)}
            });
        }
        j["invalid_entries"] = report.invalidEntryIds;
        j["negative_balances"] = json::array();
        for (const auto& negative : report.negativeBalances) {
            j["negative_balances"].push_back({
                {"account_id", negative.accountId},
                {"balance", money(negative.balance)}
            });
        }
        return j;
    }

    template <typename T>
    static json toJsonArray(const std::vector<T>& items) {
        json array = json::array();
        for (const auto& item : items) {
            array.push_back(toJson(item));
        }
        return array;
    }
};

} // namespace corebank::adapters::primary
