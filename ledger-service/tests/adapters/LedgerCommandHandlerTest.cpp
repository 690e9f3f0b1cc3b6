#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "adapters/primary/LedgerCommandHandler.hpp"
#include "adapters/secondary/persistence/InMemoryAccountStore.hpp"
#include "adapters/secondary/persistence/InMemoryNavRepository.hpp"
#include "adapters/secondary/persistence/InMemoryProductRepository.hpp"
#include "adapters/secondary/pricing/NavPricingProvider.hpp"
#include "application/AccountService.hpp"
#include "application/InvestmentService.hpp"
#include "application/LedgerAuditor.hpp"
#include "application/LedgerEngine.hpp"
#include "application/LedgerService.hpp"
#include "application/TransferOrchestrator.hpp"
#include "settings/LedgerSettings.hpp"
#include "settings/PricingSettings.hpp"

#include <sstream>

using namespace corebank;
using namespace corebank::application;
using namespace corebank::adapters::primary;
using namespace corebank::adapters::secondary;
using corebank::domain::Decimal;
using json = nlohmann::json;

// ============================================================================
// Тестовый класс LedgerCommandHandlerTest
// ============================================================================

class LedgerCommandHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<InMemoryAccountStore>();
        auto engine = std::make_shared<LedgerEngine>(store_);
        auto navs = std::make_shared<InMemoryNavRepository>();
        auto pricing = std::make_shared<NavPricingProvider>(
            navs, std::make_shared<settings::PricingSettings>(
                settings::PricingSettings::withDefaultPrice(Decimal::fromInt(1))));
        auto ledgerSettings = std::make_shared<settings::LedgerSettings>(settings::LedgerSettings::fromValues(
            Decimal::parse("0.01"), Decimal::parse("10000.00"), Decimal::parse("50000.00")));

        handler_ = std::make_unique<LedgerCommandHandler>(
            std::make_shared<LedgerService>(
                engine, std::make_shared<TransferOrchestrator>(engine), store_, ledgerSettings),
            std::make_shared<AccountService>(store_, engine),
            std::make_shared<InvestmentService>(
                engine, store_, store_, std::make_shared<InMemoryProductRepository>(), navs, pricing),
            std::make_shared<LedgerAuditor>(store_));
    }

    // Выполнить команду и разобрать JSON ответ
    json run(const std::vector<std::string>& args, int expectedCode = 0) {
        std::ostringstream out;
        int code = handler_->handle(args, out);
        EXPECT_EQ(code, expectedCode) << out.str();
        return json::parse(out.str());
    }

    std::string openAccount(const std::string& user, const std::string& deposit) {
        return run({"open-account", user, "checking", deposit})["id"].get<std::string>();
    }

    std::shared_ptr<InMemoryAccountStore> store_;
    std::unique_ptr<LedgerCommandHandler> handler_;
};

// ============================================================================
// ТЕСТЫ: счета и движения
// ============================================================================

TEST_F(LedgerCommandHandlerTest, OpenAccountAndDeposit) {
    auto account = run({"open-account", "alice", "savings", "100"});
    EXPECT_EQ(account["account_type"], "savings");
    EXPECT_EQ(account["balance"], "100.0000");

    auto movement = run({"deposit", "alice", account["id"].get<std::string>(), "25.5", "Gift"});
    EXPECT_EQ(movement["transaction_type"], "deposit");
    EXPECT_EQ(movement["balance_after"], "125.5000");
    EXPECT_EQ(movement["description"], "Gift");

    auto balance = run({"balance", account["id"].get<std::string>()});
    EXPECT_EQ(balance["balance"], "125.5000");
}

TEST_F(LedgerCommandHandlerTest, TransferReturnsBothLegs) {
    auto from = openAccount("alice", "100");
    auto to = openAccount("alice", "50");

    auto result = run({"transfer", "alice", from, to, "30"});

    EXPECT_EQ(result["from_transaction"]["balance_after"], "70.0000");
    EXPECT_EQ(result["to_transaction"]["balance_after"], "80.0000");
    EXPECT_EQ(result["from_transaction"]["related_account_id"], to);

    auto group = run({"group", "alice", result["from_transaction"]["transaction_group_id"].get<std::string>()});
    EXPECT_EQ(group["entries"].size(), 2u);
}

TEST_F(LedgerCommandHandlerTest, HistoryAndSummary) {
    auto account = openAccount("alice", "100");
    run({"withdraw", "alice", account, "40"});

    auto history = run({"history", "alice", account, "1", "1"});
    EXPECT_EQ(history["total"], 2);
    ASSERT_EQ(history["entries"].size(), 1u);
    EXPECT_EQ(history["entries"][0]["entry_type"], "debit");

    auto summary = run({"summary", "alice", account});
    EXPECT_EQ(summary["total_withdrawals"], "40.0000");
    EXPECT_EQ(summary["transaction_counts"]["deposit"], 1);

    auto accounts = run({"accounts", "alice"});
    EXPECT_EQ(accounts["accounts"].size(), 1u);
    EXPECT_EQ(accounts["summary"]["total_balance"], "60.0000");
}

// ============================================================================
// ТЕСТЫ: ошибки и коды возврата
// ============================================================================

TEST_F(LedgerCommandHandlerTest, InsufficientFundsMapsToErrorCode) {
    auto account = openAccount("alice", "10");

    auto error = run({"withdraw", "alice", account, "10.01"}, 1);

    EXPECT_EQ(error["error"], "insufficient_funds");
    EXPECT_FALSE(error["message"].get<std::string>().empty());
}

TEST_F(LedgerCommandHandlerTest, UnknownCommandAndBadArguments) {
    EXPECT_EQ(run({"explode"}, 1)["error"], "validation_error");
    EXPECT_EQ(run({"deposit", "alice"}, 1)["error"], "validation_error");
    EXPECT_EQ(run({"deposit", "alice", "acc", "ten"}, 1)["error"], "validation_error");
    EXPECT_EQ(run({"open-account", "alice", "brokerage"}, 1)["error"], "validation_error");
    EXPECT_EQ(run({"history", "alice", "acc", "first"}, 1)["error"], "validation_error");
    EXPECT_EQ(run({}, 1)["error"], "validation_error");
}

TEST_F(LedgerCommandHandlerTest, NotFoundAndBusinessRule) {
    auto account = openAccount("alice", "10");

    EXPECT_EQ(run({"deposit", "bob", account, "1"}, 1)["error"], "not_found");
    EXPECT_EQ(run({"transfer", "alice", account, account, "1"}, 1)["error"], "business_rule_violation");
}

TEST_F(LedgerCommandHandlerTest, StoreFailureIsRetryable) {
    auto account = openAccount("alice", "10");
    store_->failNextCommits();

    auto error = run({"deposit", "alice", account, "1"}, 2);

    EXPECT_EQ(error["error"], "store_failure");
}

// ============================================================================
// ТЕСТЫ: инвестиции
// ============================================================================

TEST_F(LedgerCommandHandlerTest, InvestmentFlowByProductCode) {
    auto account = openAccount("alice", "1000");
    auto product = run({"add-product", "MUT01", "Balanced fund", "mutual_fund", "10", "-", "-"});
    EXPECT_EQ(product["product_type"], "mutual_fund");
    EXPECT_TRUE(product["max_investment_amount"].is_null());

    run({"set-nav", "MUT01", "2025-12-16", "2.00"});

    auto purchase = run({"purchase", "alice", account, "MUT01", "200"});
    EXPECT_EQ(purchase["fee"], "3.0000");
    EXPECT_EQ(purchase["shares"], "98.50000000");
    EXPECT_EQ(purchase["product_id"], product["id"]);

    auto holdings = run({"holdings", "alice"});
    ASSERT_EQ(holdings.size(), 1u);
    EXPECT_EQ(holdings[0]["current_value"], "197.0000");

    auto redemption = run({"redeem", "alice", holdings[0]["id"].get<std::string>(), "50"});
    EXPECT_EQ(redemption["transaction_type"], "redemption");
    EXPECT_EQ(redemption["amount"], "100.0000");

    auto portfolio = run({"portfolio", "alice"});
    EXPECT_EQ(portfolio["active_products_count"], 1);

    auto purchases = run({"investments", "alice", "-", "purchase"});
    EXPECT_EQ(purchases.size(), 1u);

    EXPECT_EQ(run({"products"}).size(), 1u);
    EXPECT_TRUE(run({"audit"})["clean"].get<bool>());
}

TEST_F(LedgerCommandHandlerTest, NonUtf8TextIsReplacedInOutput) {
    auto account = openAccount("alice", "10");

    auto movement = run({"deposit", "alice", account, "5", "Gift \xff"});

    EXPECT_EQ(movement["description"].get<std::string>(), "Gift \xEF\xBF\xBD");
    EXPECT_EQ(store_->findAccountById(account)->balance.toString(), "15.0000");
    EXPECT_EQ(run({"\xff"}, 1)["error"], "validation_error");
}

// ============================================================================
// ТЕСТЫ: сессия
// ============================================================================

TEST_F(LedgerCommandHandlerTest, SessionRunsLineByLine) {
    std::istringstream in(
        "# comment\n"
        "\n"
        "open-account alice checking 100\n"
        "withdraw alice missing 1\n"
        "products\n");
    std::ostringstream out;

    int code = handler_->runSession(in, out);

    EXPECT_EQ(code, 1);
    std::istringstream lines(out.str());
    std::string line;
    std::vector<json> documents;
    while (std::getline(lines, line)) {
        documents.push_back(json::parse(line));
    }
    ASSERT_EQ(documents.size(), 3u);
    EXPECT_EQ(documents[0]["balance"], "100.0000");
    EXPECT_EQ(documents[1]["error"], "not_found");
    EXPECT_TRUE(documents[2].is_array());
}

TEST_F(LedgerCommandHandlerTest, SessionSkipsEmptyQuotedLineAndKeepsGoing) {
    std::istringstream in(
        "\"\"\n"
        "open-account alice checking 5\n"
        "explode\xff\n"
        "products\n");
    std::ostringstream out;

    int code = handler_->runSession(in, out);

    EXPECT_EQ(code, 1);
    std::istringstream lines(out.str());
    std::string line;
    std::vector<json> documents;
    while (std::getline(lines, line)) {
        documents.push_back(json::parse(line));
    }
    ASSERT_EQ(documents.size(), 3u);
    EXPECT_EQ(documents[0]["balance"], "5.0000");
    EXPECT_EQ(documents[1]["error"], "validation_error");
    EXPECT_TRUE(documents[2].is_array());
}

TEST(LedgerCommandTokenizerTest, QuotedArguments) {
    auto tokens = LedgerCommandHandler::tokenize(R"(deposit alice acc-1 10 "Birthday gift" "")");

    ASSERT_EQ(tokens.size(), 6u);
    EXPECT_EQ(tokens[4], "Birthday gift");
    EXPECT_EQ(tokens[5], "");
    EXPECT_THROW(LedgerCommandHandler::tokenize("deposit \"open"), corebank::domain::ValidationException);
}
