#include "adapters/primary/LedgerCommandHandler.hpp"
#include "adapters/primary/JsonMapper.hpp"
#include "domain/LedgerErrors.hpp"

#include <cctype>
#include <iostream>
#include <sstream>

namespace corebank::adapters::primary {

using json = nlohmann::json;

namespace {

void requireArgs(const std::vector<std::string>& args, size_t min, size_t max, const std::string& usage) {
    // args[0] - имя команды
    if (args.size() < min + 1 || args.size() > max + 1) {
        throw domain::ValidationException("Usage: " + usage);
    }
}

std::string argOr(const std::vector<std::string>& args, size_t index, const std::string& fallback) {
    return index < args.size() ? args[index] : fallback;
}

domain::Decimal parseAmount(const std::string& text) {
    return domain::Decimal::parse(text);
}

int parseInt(const std::string& text, const std::string& name) {
    try {
        size_t consumed = 0;
        int value = std::stoi(text, &consumed);
        if (consumed != text.size()) {
            throw domain::ValidationException("Invalid " + name + ": '" + text + "'");
        }
        return value;
    } catch (const std::logic_error&) {
        throw domain::ValidationException("Invalid " + name + ": '" + text + "'");
    }
}

// "-" в позиционном аргументе означает "не задано"
std::optional<std::string> optionalArg(const std::vector<std::string>& args, size_t index) {
    if (index >= args.size() || args[index] == "-") {
        return std::nullopt;
    }
    return args[index];
}

template <typename Enum>
Enum parseEnum(Enum (*fromString)(const std::string&), const std::string& text, const std::string& name) {
    try {
        return fromString(text);
    } catch (const std::invalid_argument&) {
        throw domain::ValidationException("Unknown " + name + ": '" + text + "'");
    }
}

} // namespace

LedgerCommandHandler::LedgerCommandHandler(
    std::shared_ptr<ports::input::ILedgerService> ledgerService,
    std::shared_ptr<ports::input::IAccountService> accountService,
    std::shared_ptr<ports::input::IInvestmentService> investmentService,
    std::shared_ptr<application::LedgerAuditor> auditor)
    : ledgerService_(std::move(ledgerService))
    , accountService_(std::move(accountService))
    , investmentService_(std::move(investmentService))
    , auditor_(std::move(auditor))
{
    registerCommands();
    std::clog << "[LedgerCommandHandler] Created with " << commands_.size() << " commands" << std::endl;
}

int LedgerCommandHandler::handle(const std::vector<std::string>& args, std::ostream& out) {
    if (args.empty()) {
        out << render(errorJson("validation_error", "No command given")) << std::endl;
        return EXIT_FAILURE_CODE;
    }

    auto it = commands_.find(args[0]);
    if (it == commands_.end()) {
        out << render(errorJson("validation_error", "Unknown command: " + args[0])) << std::endl;
        return EXIT_FAILURE_CODE;
    }

    try {
        out << render(it->second(args)) << std::endl;
        return EXIT_OK;
    } catch (const domain::LedgerException& e) {
        out << render(errorJson(domain::toString(e.kind()), e.what())) << std::endl;
        return domain::isRetryable(e.kind()) ? EXIT_RETRYABLE : EXIT_FAILURE_CODE;
    } catch (const std::invalid_argument& e) {
        out << render(errorJson("validation_error", e.what())) << std::endl;
        return EXIT_FAILURE_CODE;
    }
}

int LedgerCommandHandler::runSession(std::istream& in, std::ostream& out) {
    int lastFailure = EXIT_OK;
    std::string line;
    while (std::getline(in, line)) {
        std::vector<std::string> args;
        try {
            args = tokenize(line);
        } catch (const domain::LedgerException& e) {
            out << render(errorJson(domain::toString(e.kind()), e.what())) << std::endl;
            lastFailure = EXIT_FAILURE_CODE;
            continue;
        }
        if (args.empty() || args[0].empty() || args[0].front() == '#') {
            continue;
        }
        int code = handle(args, out);
        if (code != EXIT_OK) {
            lastFailure = code;
        }
    }
    return lastFailure;
}

std::vector<std::string> LedgerCommandHandler::tokenize(const std::string& line) {
    std::vector<std::string> tokens;
    std::string current;
    bool inQuotes = false;
    bool hasToken = false;

    for (char c : line) {
        if (c == '"') {
            inQuotes = !inQuotes;
            hasToken = true;
        } else if (!inQuotes && std::isspace(static_cast<unsigned char>(c))) {
            if (hasToken) {
                tokens.push_back(current);
                current.clear();
                hasToken = false;
            }
        } else {
            current += c;
            hasToken = true;
        }
    }
    if (inQuotes) {
        throw domain::ValidationException("Unterminated quote in: " + line);
    }
    if (hasToken) {
        tokens.push_back(current);
    }
    return tokens;
}

std::string LedgerCommandHandler::render(const json& document) {
    // Байты не из UTF-8 (описание, имя команды) заменяются на U+FFFD
    return document.dump(-1, ' ', false, json::error_handler_t::replace);
}

json LedgerCommandHandler::errorJson(const std::string& code, const std::string& message) {
    return {{"error", code}, {"message", message}};
}

std::string LedgerCommandHandler::resolveProductId(const std::string& reference) {
    for (const auto& product : investmentService_->getProducts()) {
        if (product.code == reference) {
            return product.id;
        }
    }
    return reference;
}

void LedgerCommandHandler::registerCommands() {
    // ========================================================================
    // Движение денег
    // ========================================================================

    commands_["deposit"] = [this](const Args& a) {
        requireArgs(a, 3, 4, "deposit <user> <account> <amount> [description]");
        return JsonMapper::toJson(ledgerService_->deposit(a[1], a[2], parseAmount(a[3]), argOr(a, 4, "")));
    };

    commands_["withdraw"] = [this](const Args& a) {
        requireArgs(a, 3, 4, "withdraw <user> <account> <amount> [description]");
        return JsonMapper::toJson(ledgerService_->withdraw(a[1], a[2], parseAmount(a[3]), argOr(a, 4, "")));
    };

    commands_["transfer"] = [this](const Args& a) {
        requireArgs(a, 4, 5, "transfer <user> <from> <to> <amount> [description]");
        auto [out, in] = ledgerService_->transfer(a[1], a[2], a[3], parseAmount(a[4]), argOr(a, 5, ""));
        return json{
            {"from_transaction", JsonMapper::toJson(out)},
            {"to_transaction", JsonMapper::toJson(in)}
        };
    };

    commands_["balance"] = [this](const Args& a) {
        requireArgs(a, 1, 1, "balance <account>");
        auto account = accountService_->getAccount(a[1]);
        return json{
            {"account_id", account.id},
            {"account_number", account.number},
            {"balance", JsonMapper::money(account.balance)}
        };
    };

    commands_["history"] = [this](const Args& a) {
        requireArgs(a, 2, 4, "history <user> <account> [page] [pageSize]");
        int page = a.size() > 3 ? parseInt(a[3], "page") : 1;
        int pageSize = a.size() > 4 ? parseInt(a[4], "page size") : 20;
        return JsonMapper::toJson(ledgerService_->getAccountHistory(a[1], a[2], page, pageSize));
    };

    commands_["summary"] = [this](const Args& a) {
        requireArgs(a, 2, 2, "summary <user> <account>");
        return JsonMapper::toJson(ledgerService_->getTransactionSummary(a[1], a[2]));
    };

    commands_["group"] = [this](const Args& a) {
        requireArgs(a, 2, 2, "group <user> <groupId>");
        return JsonMapper::toJson(ledgerService_->getTransactionGroup(a[1], a[2]));
    };

    // ========================================================================
    // Инвестиции
    // ========================================================================

    commands_["purchase"] = [this](const Args& a) {
        requireArgs(a, 4, 4, "purchase <user> <account> <product> <amount>");
        return JsonMapper::toJson(
            investmentService_->purchase(a[1], a[2], resolveProductId(a[3]), parseAmount(a[4])));
    };

    commands_["redeem"] = [this](const Args& a) {
        requireArgs(a, 2, 3, "redeem <user> <holding> [shares]");
        std::optional<domain::Decimal> shares;
        if (a.size() > 3) {
            shares = parseAmount(a[3]);
        }
        return JsonMapper::toJson(investmentService_->redeem(a[1], a[2], shares));
    };

    commands_["holdings"] = [this](const Args& a) {
        requireArgs(a, 1, 1, "holdings <user>");
        return JsonMapper::toJsonArray(investmentService_->getHoldings(a[1]));
    };

    commands_["portfolio"] = [this](const Args& a) {
        requireArgs(a, 1, 1, "portfolio <user>");
        return JsonMapper::toJson(investmentService_->getPortfolioSummary(a[1]));
    };

    commands_["investments"] = [this](const Args& a) {
        requireArgs(a, 1, 5, "investments <user> [product|-] [kind|-] [skip] [limit]");
        auto product = optionalArg(a, 2);
        if (product) {
            product = resolveProductId(*product);
        }
        std::optional<domain::InvestmentTransactionKind> kind;
        if (auto text = optionalArg(a, 3)) {
            kind = parseEnum(&domain::investmentTransactionKindFromString, *text, "transaction kind");
        }
        int skip = a.size() > 4 ? parseInt(a[4], "skip") : 0;
        int limit = a.size() > 5 ? parseInt(a[5], "limit") : 100;
        return JsonMapper::toJsonArray(
            investmentService_->getInvestmentTransactions(a[1], product, kind, skip, limit));
    };

    commands_["audit"] = [this](const Args& a) {
        requireArgs(a, 0, 0, "audit");
        return JsonMapper::toJson(auditor_->audit());
    };

    // ========================================================================
    // Счета и каталог
    // ========================================================================

    commands_["open-account"] = [this](const Args& a) {
        requireArgs(a, 2, 3, "open-account <user> <checking|savings> [initialDeposit]");
        auto type = parseEnum(&domain::accountTypeFromString, a[2], "account type");
        std::optional<domain::Decimal> initialDeposit;
        if (a.size() > 3) {
            initialDeposit = parseAmount(a[3]);
        }
        return JsonMapper::toJson(accountService_->openAccount(a[1], type, initialDeposit));
    };

    commands_["accounts"] = [this](const Args& a) {
        requireArgs(a, 1, 1, "accounts <user>");
        json result;
        result["accounts"] = JsonMapper::toJsonArray(accountService_->getUserAccounts(a[1]));
        result["summary"] = JsonMapper::toJson(accountService_->getAccountSummary(a[1]));
        return result;
    };

    commands_["add-product"] = [this](const Args& a) {
        requireArgs(a, 3, 6, "add-product <code> <name> <type> [min] [max] [periodDays]");
        domain::InvestmentProduct product;
        product.code = a[1];
        product.name = a[2];
        product.type = domain::productTypeFromString(a[3]);
        if (auto min = optionalArg(a, 4)) {
            product.minInvestmentAmount = parseAmount(*min);
        }
        if (auto max = optionalArg(a, 5)) {
            product.maxInvestmentAmount = parseAmount(*max);
        }
        if (auto days = optionalArg(a, 6)) {
            product.investmentPeriodDays = parseInt(*days, "period days");
        }
        return JsonMapper::toJson(investmentService_->addProduct(product));
    };

    commands_["products"] = [this](const Args& a) {
        requireArgs(a, 0, 0, "products");
        return JsonMapper::toJsonArray(investmentService_->getProducts());
    };

    commands_["set-nav"] = [this](const Args& a) {
        requireArgs(a, 3, 3, "set-nav <product> <YYYY-MM-DD> <price>");
        domain::NavRecord record{resolveProductId(a[1]), a[2], parseAmount(a[3])};
        investmentService_->publishNav(record);
        return JsonMapper::toJson(record);
    };
}

} // namespace corebank::adapters::primary
