#include "adapters/secondary/persistence/PostgresAccountStore.hpp"
#include "domain/LedgerErrors.hpp"

#include <iostream>
#include <optional>

namespace corebank::adapters::secondary {

namespace {

const char* ACCOUNT_COLUMNS =
    "id, account_number, owner_id, account_type, balance::text AS balance, "
    "created_at::text AS created_at, updated_at::text AS updated_at";

const char* GROUP_COLUMNS =
    "id, kind, description, total_amount::text AS total_amount, status, "
    "created_at::text AS created_at, updated_at::text AS updated_at";

const char* ENTRY_COLUMNS =
    "id, group_id, account_id, entry_type, amount::text AS amount, "
    "balance_after::text AS balance_after, description, created_at::text AS created_at";

const char* HOLDING_COLUMNS =
    "id, user_id, account_id, product_id, shares::text AS shares, "
    "average_cost::text AS average_cost, total_invested::text AS total_invested, "
    "realized_gain_loss::text AS realized_gain_loss, purchase_date::text AS purchase_date, "
    "maturity_date::text AS maturity_date, status, "
    "created_at::text AS created_at, updated_at::text AS updated_at";

const char* INVESTMENT_TRANSACTION_COLUMNS =
    "id, user_id, account_id, product_id, holding_id, transaction_group_id, transaction_type, "
    "shares::text AS shares, unit_price::text AS unit_price, gross_amount::text AS gross_amount, "
    "fee::text AS fee, net_amount::text AS net_amount, status, description, "
    "settlement_date::text AS settlement_date, created_at::text AS created_at";

std::string money(const domain::Decimal& value) {
    return value.toString(domain::Decimal::MONEY_SCALE);
}

std::string shares(const domain::Decimal& value) {
    return value.toString(domain::Decimal::SHARES_SCALE);
}

std::optional<std::string> optionalText(const pqxx::field& field) {
    if (field.is_null()) {
        return std::nullopt;
    }
    return field.as<std::string>();
}

/**
 * @brief Выполнить тело, переведя ошибки libpqxx в StoreFailureException
 */
template <typename F>
auto guarded(const char* component, const char* operation, F&& body) -> decltype(body()) {
    try {
        return body();
    } catch (const domain::LedgerException&) {
        throw;
    } catch (const std::exception& e) {
        std::cerr << "[" << component << "] " << operation << " error: " << e.what() << std::endl;
        throw domain::StoreFailureException(std::string(operation) + ": " + e.what());
    }
}

} // namespace

// ============================================
// Row mapping
// ============================================

domain::Account PostgresAccountStore::toAccount(const pqxx::row& row) {
    domain::Account account;
    account.id = row["id"].as<std::string>();
    account.number = row["account_number"].as<std::string>();
    account.ownerId = row["owner_id"].as<std::string>();
    account.type = domain::accountTypeFromString(row["account_type"].as<std::string>());
    account.balance = domain::Decimal::parse(row["balance"].as<std::string>());
    account.createdAt = domain::Timestamp::fromString(row["created_at"].as<std::string>());
    account.updatedAt = domain::Timestamp::fromString(row["updated_at"].as<std::string>());
    return account;
}

domain::TransactionGroup PostgresAccountStore::toGroup(const pqxx::row& row) {
    domain::TransactionGroup group;
    group.id = row["id"].as<std::string>();
    group.kind = domain::transactionKindFromString(row["kind"].as<std::string>());
    group.description = row["description"].as<std::string>();
    group.totalAmount = domain::Decimal::parse(row["total_amount"].as<std::string>());
    group.status = domain::transactionStatusFromString(row["status"].as<std::string>());
    group.createdAt = domain::Timestamp::fromString(row["created_at"].as<std::string>());
    group.updatedAt = domain::Timestamp::fromString(row["updated_at"].as<std::string>());
    return group;
}

domain::TransactionEntry PostgresAccountStore::toEntry(const pqxx::row& row) {
    domain::TransactionEntry entry;
    entry.id = row["id"].as<std::string>();
    entry.groupId = row["group_id"].as<std::string>();
    entry.accountId = optionalText(row["account_id"]);
    entry.entryType = domain::entryTypeFromString(row["entry_type"].as<std::string>());
    entry.amount = domain::Decimal::parse(row["amount"].as<std::string>());
    if (auto balanceAfter = optionalText(row["balance_after"])) {
        entry.balanceAfter = domain::Decimal::parse(*balanceAfter);
    }
    entry.description = row["description"].as<std::string>();
    entry.createdAt = domain::Timestamp::fromString(row["created_at"].as<std::string>());
    return entry;
}

domain::InvestmentHolding PostgresAccountStore::toHolding(const pqxx::row& row) {
    domain::InvestmentHolding holding;
    holding.id = row["id"].as<std::string>();
    holding.userId = row["user_id"].as<std::string>();
    holding.accountId = row["account_id"].as<std::string>();
    holding.productId = row["product_id"].as<std::string>();
    holding.shares = domain::Decimal::parse(row["shares"].as<std::string>());
    holding.averageCost = domain::Decimal::parse(row["average_cost"].as<std::string>());
    holding.totalInvested = domain::Decimal::parse(row["total_invested"].as<std::string>());
    holding.realizedGainLoss = domain::Decimal::parse(row["realized_gain_loss"].as<std::string>());
    holding.purchaseDate = domain::Timestamp::fromString(row["purchase_date"].as<std::string>());
    if (auto maturity = optionalText(row["maturity_date"])) {
        holding.maturityDate = domain::Timestamp::fromString(*maturity);
    }
    holding.status = domain::holdingStatusFromString(row["status"].as<std::string>());
    holding.createdAt = domain::Timestamp::fromString(row["created_at"].as<std::string>());
    holding.updatedAt = domain::Timestamp::fromString(row["updated_at"].as<std::string>());
    return holding;
}

domain::InvestmentTransaction PostgresAccountStore::toInvestmentTransaction(const pqxx::row& row) {
    domain::InvestmentTransaction tx;
    tx.id = row["id"].as<std::string>();
    tx.userId = row["user_id"].as<std::string>();
    tx.accountId = row["account_id"].as<std::string>();
    tx.productId = row["product_id"].as<std::string>();
    tx.holdingId = optionalText(row["holding_id"]);
    tx.transactionGroupId = optionalText(row["transaction_group_id"]);
    tx.kind = domain::investmentTransactionKindFromString(row["transaction_type"].as<std::string>());
    tx.shares = domain::Decimal::parse(row["shares"].as<std::string>());
    tx.unitPrice = domain::Decimal::parse(row["unit_price"].as<std::string>());
    tx.grossAmount = domain::Decimal::parse(row["gross_amount"].as<std::string>());
    tx.fee = domain::Decimal::parse(row["fee"].as<std::string>());
    tx.netAmount = domain::Decimal::parse(row["net_amount"].as<std::string>());
    tx.status = domain::investmentTransactionStatusFromString(row["status"].as<std::string>());
    tx.description = row["description"].as<std::string>();
    tx.settlementDate = domain::Timestamp::fromString(row["settlement_date"].as<std::string>());
    tx.createdAt = domain::Timestamp::fromString(row["created_at"].as<std::string>());
    return tx;
}

// ============================================
// PostgresAccountStore
// ============================================

PostgresAccountStore::PostgresAccountStore(std::shared_ptr<settings::DbSettings> settings)
    : settings_(std::move(settings))
{
    initSchema();
}

std::unique_ptr<ports::output::IUnitOfWork> PostgresAccountStore::beginUnitOfWork() {
    return guarded("PostgresAccountStore", "beginUnitOfWork", [&]() -> std::unique_ptr<ports::output::IUnitOfWork> {
        return std::make_unique<PostgresUnitOfWork>(settings_->getConnectionString());
    });
}

void PostgresAccountStore::createAccount(const domain::Account& account) {
    guarded("PostgresAccountStore", "createAccount", [&]() {
        pqxx::connection conn(settings_->getConnectionString());
        pqxx::work txn(conn);

        auto existing = txn.exec_params(
            "SELECT 1 FROM accounts WHERE id = $1 OR account_number = $2",
            account.id, account.number
        );
        if (!existing.empty()) {
            throw domain::BusinessRuleException("Account id or number already exists: " + account.number);
        }

        txn.exec_params(
            "INSERT INTO accounts (id, account_number, owner_id, account_type, balance, created_at, updated_at) "
            "VALUES ($1, $2, $3, $4, $5, $6, $6)",
            account.id,
            account.number,
            account.ownerId,
            domain::toString(account.type),
            money(account.balance),
            account.createdAt.toString()
        );

        txn.commit();
        std::clog << "[PostgresAccountStore] Created account " << account.number << std::endl;
    });
}

std::optional<domain::Account> PostgresAccountStore::findAccountById(const std::string& accountId) {
    return guarded("PostgresAccountStore", "findAccountById", [&]() -> std::optional<domain::Account> {
        pqxx::connection conn(settings_->getConnectionString());
        pqxx::work txn(conn);
        auto result = txn.exec_params(
            std::string("SELECT ") + ACCOUNT_COLUMNS + " FROM accounts WHERE id = $1", accountId);
        if (result.empty()) {
            return std::nullopt;
        }
        return toAccount(result[0]);
    });
}

std::optional<domain::Account> PostgresAccountStore::findAccountByNumber(const std::string& number) {
    return guarded("PostgresAccountStore", "findAccountByNumber", [&]() -> std::optional<domain::Account> {
        pqxx::connection conn(settings_->getConnectionString());
        pqxx::work txn(conn);
        auto result = txn.exec_params(
            std::string("SELECT ") + ACCOUNT_COLUMNS + " FROM accounts WHERE account_number = $1", number);
        if (result.empty()) {
            return std::nullopt;
        }
        return toAccount(result[0]);
    });
}

std::vector<domain::Account> PostgresAccountStore::findAccountsByOwner(const std::string& ownerId) {
    return guarded("PostgresAccountStore", "findAccountsByOwner", [&]() {
        pqxx::connection conn(settings_->getConnectionString());
        pqxx::work txn(conn);
        auto result = txn.exec_params(
            std::string("SELECT ") + ACCOUNT_COLUMNS + " FROM accounts WHERE owner_id = $1 ORDER BY created_at",
            ownerId);
        std::vector<domain::Account> accounts;
        for (const auto& row : result) {
            accounts.push_back(toAccount(row));
        }
        return accounts;
    });
}

std::vector<domain::Account> PostgresAccountStore::findAllAccounts() {
    return guarded("PostgresAccountStore", "findAllAccounts", [&]() {
        pqxx::connection conn(settings_->getConnectionString());
        pqxx::work txn(conn);
        auto result = txn.exec(std::string("SELECT ") + ACCOUNT_COLUMNS + " FROM accounts ORDER BY created_at");
        std::vector<domain::Account> accounts;
        for (const auto& row : result) {
            accounts.push_back(toAccount(row));
        }
        return accounts;
    });
}

std::optional<domain::TransactionGroup> PostgresAccountStore::findTransactionGroupById(const std::string& groupId) {
    return guarded("PostgresAccountStore", "findTransactionGroupById", [&]() -> std::optional<domain::TransactionGroup> {
        pqxx::connection conn(settings_->getConnectionString());
        pqxx::work txn(conn);
        auto result = txn.exec_params(
            std::string("SELECT ") + GROUP_COLUMNS + " FROM transaction_groups WHERE id = $1", groupId);
        if (result.empty()) {
            return std::nullopt;
        }
        return toGroup(result[0]);
    });
}

std::vector<domain::TransactionGroup> PostgresAccountStore::findAllTransactionGroups() {
    return guarded("PostgresAccountStore", "findAllTransactionGroups", [&]() {
        pqxx::connection conn(settings_->getConnectionString());
        pqxx::work txn(conn);
        auto result = txn.exec(std::string("SELECT ") + GROUP_COLUMNS + " FROM transaction_groups ORDER BY seq");
        std::vector<domain::TransactionGroup> groups;
        for (const auto& row : result) {
            groups.push_back(toGroup(row));
        }
        return groups;
    });
}

std::vector<domain::TransactionEntry> PostgresAccountStore::findEntriesByGroupId(const std::string& groupId) {
    return guarded("PostgresAccountStore", "findEntriesByGroupId", [&]() {
        pqxx::connection conn(settings_->getConnectionString());
        pqxx::work txn(conn);
        auto result = txn.exec_params(
            std::string("SELECT ") + ENTRY_COLUMNS + " FROM transaction_entries WHERE group_id = $1 ORDER BY seq",
            groupId);
        std::vector<domain::TransactionEntry> entries;
        for (const auto& row : result) {
            entries.push_back(toEntry(row));
        }
        return entries;
    });
}

std::vector<domain::TransactionEntry> PostgresAccountStore::findEntriesByAccountId(
    const std::string& accountId, int limit, int offset) {
    return guarded("PostgresAccountStore", "findEntriesByAccountId", [&]() {
        pqxx::connection conn(settings_->getConnectionString());
        pqxx::work txn(conn);
        auto result = txn.exec_params(
            std::string("SELECT ") + ENTRY_COLUMNS + " FROM transaction_entries "
            "WHERE account_id = $1 ORDER BY seq DESC LIMIT $2 OFFSET $3",
            accountId, limit, offset);
        std::vector<domain::TransactionEntry> entries;
        for (const auto& row : result) {
            entries.push_back(toEntry(row));
        }
        return entries;
    });
}

int64_t PostgresAccountStore::countEntriesByAccountId(const std::string& accountId) {
    return guarded("PostgresAccountStore", "countEntriesByAccountId", [&]() {
        pqxx::connection conn(settings_->getConnectionString());
        pqxx::work txn(conn);
        auto result = txn.exec_params(
            "SELECT COUNT(*) FROM transaction_entries WHERE account_id = $1", accountId);
        return result[0][0].as<int64_t>();
    });
}

std::optional<domain::InvestmentHolding> PostgresAccountStore::findHoldingById(const std::string& holdingId) {
    return guarded("PostgresAccountStore", "findHoldingById", [&]() -> std::optional<domain::InvestmentHolding> {
        pqxx::connection conn(settings_->getConnectionString());
        pqxx::work txn(conn);
        auto result = txn.exec_params(
            std::string("SELECT ") + HOLDING_COLUMNS + " FROM investment_holdings WHERE id = $1", holdingId);
        if (result.empty()) {
            return std::nullopt;
        }
        return toHolding(result[0]);
    });
}

std::vector<domain::InvestmentHolding> PostgresAccountStore::findHoldingsByUserId(const std::string& userId) {
    return guarded("PostgresAccountStore", "findHoldingsByUserId", [&]() {
        pqxx::connection conn(settings_->getConnectionString());
        pqxx::work txn(conn);
        auto result = txn.exec_params(
            std::string("SELECT ") + HOLDING_COLUMNS + " FROM investment_holdings "
            "WHERE user_id = $1 ORDER BY seq DESC",
            userId);
        std::vector<domain::InvestmentHolding> holdings;
        for (const auto& row : result) {
            holdings.push_back(toHolding(row));
        }
        return holdings;
    });
}

std::vector<domain::InvestmentTransaction> PostgresAccountStore::findInvestmentTransactionsByUserId(
    const std::string& userId,
    const std::optional<std::string>& productId,
    const std::optional<domain::InvestmentTransactionKind>& kind,
    int limit,
    int offset) {
    return guarded("PostgresAccountStore", "findInvestmentTransactionsByUserId", [&]() {
        pqxx::connection conn(settings_->getConnectionString());
        pqxx::work txn(conn);

        std::optional<std::string> kindText;
        if (kind) {
            kindText = domain::toString(*kind);
        }

        auto result = txn.exec_params(
            std::string("SELECT ") + INVESTMENT_TRANSACTION_COLUMNS + " FROM investment_transactions "
            "WHERE user_id = $1 "
            "AND ($2::varchar IS NULL OR product_id = $2) "
            "AND ($3::varchar IS NULL OR transaction_type = $3) "
            "ORDER BY seq DESC LIMIT $4 OFFSET $5",
            userId, productId, kindText, limit, offset);

        std::vector<domain::InvestmentTransaction> transactions;
        for (const auto& row : result) {
            transactions.push_back(toInvestmentTransaction(row));
        }
        return transactions;
    });
}

void PostgresAccountStore::initSchema() {
    guarded("PostgresAccountStore", "initSchema", [&]() {
        pqxx::connection conn(settings_->getConnectionString());
        pqxx::work txn(conn);

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS accounts (
                id VARCHAR(64) PRIMARY KEY,
                account_number VARCHAR(20) NOT NULL UNIQUE,
                owner_id VARCHAR(64) NOT NULL,
                account_type VARCHAR(20) NOT NULL,
                balance NUMERIC(19,4) NOT NULL DEFAULT 0 CHECK (balance >= 0),
                created_at TIMESTAMP NOT NULL DEFAULT NOW(),
                updated_at TIMESTAMP NOT NULL DEFAULT NOW()
            )
        )");
        txn.exec("CREATE INDEX IF NOT EXISTS idx_accounts_owner ON accounts(owner_id)");

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS transaction_groups (
                id VARCHAR(64) PRIMARY KEY,
                seq BIGSERIAL,
                kind VARCHAR(32) NOT NULL,
                description TEXT NOT NULL DEFAULT '',
                total_amount NUMERIC(19,4) NOT NULL CHECK (total_amount > 0),
                status VARCHAR(20) NOT NULL,
                created_at TIMESTAMP NOT NULL DEFAULT NOW(),
                updated_at TIMESTAMP NOT NULL DEFAULT NOW()
            )
        )");

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS transaction_entries (
                id VARCHAR(64) PRIMARY KEY,
                seq BIGSERIAL,
                group_id VARCHAR(64) NOT NULL REFERENCES transaction_groups(id),
                account_id VARCHAR(64) REFERENCES accounts(id),
                entry_type VARCHAR(10) NOT NULL,
                amount NUMERIC(19,4) NOT NULL CHECK (amount > 0),
                balance_after NUMERIC(19,4),
                description TEXT NOT NULL DEFAULT '',
                created_at TIMESTAMP NOT NULL DEFAULT NOW()
            )
        )");
        txn.exec("CREATE INDEX IF NOT EXISTS idx_entries_group ON transaction_entries(group_id)");
        txn.exec("CREATE INDEX IF NOT EXISTS idx_entries_account ON transaction_entries(account_id, seq)");

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS investment_holdings (
                id VARCHAR(64) PRIMARY KEY,
                seq BIGSERIAL,
                user_id VARCHAR(64) NOT NULL,
                account_id VARCHAR(64) NOT NULL REFERENCES accounts(id),
                product_id VARCHAR(64) NOT NULL,
                shares NUMERIC(19,8) NOT NULL CHECK (shares >= 0),
                average_cost NUMERIC(19,4) NOT NULL,
                total_invested NUMERIC(19,4) NOT NULL CHECK (total_invested >= 0),
                realized_gain_loss NUMERIC(19,4) NOT NULL DEFAULT 0,
                purchase_date TIMESTAMP NOT NULL,
                maturity_date TIMESTAMP,
                status VARCHAR(20) NOT NULL,
                created_at TIMESTAMP NOT NULL DEFAULT NOW(),
                updated_at TIMESTAMP NOT NULL DEFAULT NOW()
            )
        )");
        txn.exec(
            "CREATE UNIQUE INDEX IF NOT EXISTS uq_holdings_active_user_product "
            "ON investment_holdings(user_id, product_id) WHERE status = 'active'");

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS investment_transactions (
                id VARCHAR(64) PRIMARY KEY,
                seq BIGSERIAL,
                user_id VARCHAR(64) NOT NULL,
                account_id VARCHAR(64) NOT NULL REFERENCES accounts(id),
                product_id VARCHAR(64) NOT NULL,
                holding_id VARCHAR(64) REFERENCES investment_holdings(id),
                transaction_group_id VARCHAR(64) REFERENCES transaction_groups(id),
                transaction_type VARCHAR(20) NOT NULL,
                shares NUMERIC(19,8) NOT NULL,
                unit_price NUMERIC(19,4) NOT NULL,
                gross_amount NUMERIC(19,4) NOT NULL,
                fee NUMERIC(19,4) NOT NULL DEFAULT 0 CHECK (fee >= 0),
                net_amount NUMERIC(19,4) NOT NULL,
                status VARCHAR(20) NOT NULL,
                description TEXT NOT NULL DEFAULT '',
                settlement_date TIMESTAMP NOT NULL,
                created_at TIMESTAMP NOT NULL DEFAULT NOW()
            )
        )");
        txn.exec("CREATE INDEX IF NOT EXISTS idx_investment_tx_user ON investment_transactions(user_id, seq)");

        txn.commit();
        std::clog << "[PostgresAccountStore] Schema initialized" << std::endl;
    });
}

// ============================================
// PostgresUnitOfWork
// ============================================

PostgresUnitOfWork::PostgresUnitOfWork(const std::string& connectionString)
    : conn_(std::make_unique<pqxx::connection>(connectionString)),
      txn_(std::make_unique<pqxx::work>(*conn_))
{
}

PostgresUnitOfWork::~PostgresUnitOfWork() {
    // Незакоммиченная pqxx::work откатывается в своём деструкторе
    txn_.reset();
}

pqxx::work& PostgresUnitOfWork::txn() {
    if (!txn_) {
        throw domain::StoreFailureException("Unit of work already finished");
    }
    return *txn_;
}

std::optional<domain::Account> PostgresUnitOfWork::getAccountForUpdate(const std::string& accountId) {
    return guarded("PostgresUnitOfWork", "getAccountForUpdate", [&]() -> std::optional<domain::Account> {
        auto result = txn().exec_params(
            std::string("SELECT ") + ACCOUNT_COLUMNS + " FROM accounts WHERE id = $1 FOR UPDATE", accountId);
        if (result.empty()) {
            return std::nullopt;
        }
        return PostgresAccountStore::toAccount(result[0]);
    });
}

void PostgresUnitOfWork::insertAccount(const domain::Account& account) {
    guarded("PostgresUnitOfWork", "insertAccount", [&]() {
        auto existing = txn().exec_params(
            "SELECT 1 FROM accounts WHERE id = $1 OR account_number = $2",
            account.id, account.number
        );
        if (!existing.empty()) {
            throw domain::BusinessRuleException("Account id or number already exists: " + account.number);
        }

        // Вставленная строка принадлежит этой транзакции до commit
        txn().exec_params(
            "INSERT INTO accounts (id, account_number, owner_id, account_type, balance, created_at, updated_at) "
            "VALUES ($1, $2, $3, $4, $5, $6, $6)",
            account.id,
            account.number,
            account.ownerId,
            domain::toString(account.type),
            money(account.balance),
            account.createdAt.toString()
        );
    });
}

bool PostgresUnitOfWork::setBalance(const std::string& accountId, const domain::Decimal& balance) {
    return guarded("PostgresUnitOfWork", "setBalance", [&]() {
        auto result = txn().exec_params(
            "UPDATE accounts SET balance = $2, updated_at = NOW() WHERE id = $1 RETURNING id",
            accountId, money(balance));
        return !result.empty();
    });
}

void PostgresUnitOfWork::insertTransactionGroup(const domain::TransactionGroup& group) {
    guarded("PostgresUnitOfWork", "insertTransactionGroup", [&]() {
        txn().exec_params(
            "INSERT INTO transaction_groups (id, kind, description, total_amount, status, created_at, updated_at) "
            "VALUES ($1, $2, $3, $4, $5, $6, $7)",
            group.id,
            domain::toString(group.kind),
            group.description,
            money(group.totalAmount),
            domain::toString(group.status),
            group.createdAt.toString(),
            group.updatedAt.toString());
    });
}

void PostgresUnitOfWork::insertTransactionEntry(const domain::TransactionEntry& entry) {
    guarded("PostgresUnitOfWork", "insertTransactionEntry", [&]() {
        std::optional<std::string> balanceAfter;
        if (entry.balanceAfter) {
            balanceAfter = money(*entry.balanceAfter);
        }
        txn().exec_params(
            "INSERT INTO transaction_entries "
            "(id, group_id, account_id, entry_type, amount, balance_after, description, created_at) "
            "VALUES ($1, $2, $3, $4, $5, $6, $7, $8)",
            entry.id,
            entry.groupId,
            entry.accountId,
            domain::toString(entry.entryType),
            money(entry.amount),
            balanceAfter,
            entry.description,
            entry.createdAt.toString());
    });
}

std::optional<domain::InvestmentHolding> PostgresUnitOfWork::findActiveHoldingForUpdate(
    const std::string& userId, const std::string& productId) {
    return guarded("PostgresUnitOfWork", "findActiveHoldingForUpdate", [&]() -> std::optional<domain::InvestmentHolding> {
        // Блокировка ключа (user, product), даже если позиции ещё нет
        txn().exec_params("SELECT pg_advisory_xact_lock(hashtext($1))", "holding:" + userId + "/" + productId);

        auto result = txn().exec_params(
            std::string("SELECT ") + HOLDING_COLUMNS + " FROM investment_holdings "
            "WHERE user_id = $1 AND product_id = $2 AND status = 'active' FOR UPDATE",
            userId, productId);
        if (result.empty()) {
            return std::nullopt;
        }
        return PostgresAccountStore::toHolding(result[0]);
    });
}

std::optional<domain::InvestmentHolding> PostgresUnitOfWork::getHoldingForUpdate(const std::string& holdingId) {
    return guarded("PostgresUnitOfWork", "getHoldingForUpdate", [&]() -> std::optional<domain::InvestmentHolding> {
        auto result = txn().exec_params(
            std::string("SELECT ") + HOLDING_COLUMNS + " FROM investment_holdings WHERE id = $1 FOR UPDATE",
            holdingId);
        if (result.empty()) {
            return std::nullopt;
        }
        return PostgresAccountStore::toHolding(result[0]);
    });
}

void PostgresUnitOfWork::insertHolding(const domain::InvestmentHolding& holding) {
    guarded("PostgresUnitOfWork", "insertHolding", [&]() {
        std::optional<std::string> maturity;
        if (holding.maturityDate) {
            maturity = holding.maturityDate->toString();
        }
        txn().exec_params(
            "INSERT INTO investment_holdings "
            "(id, user_id, account_id, product_id, shares, average_cost, total_invested, realized_gain_loss, "
            " purchase_date, maturity_date, status, created_at, updated_at) "
            "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $12)",
            holding.id,
            holding.userId,
            holding.accountId,
            holding.productId,
            shares(holding.shares),
            money(holding.averageCost),
            money(holding.totalInvested),
            money(holding.realizedGainLoss),
            holding.purchaseDate.toString(),
            maturity,
            domain::toString(holding.status),
            holding.createdAt.toString());
    });
}

void PostgresUnitOfWork::updateHolding(const domain::InvestmentHolding& holding) {
    guarded("PostgresUnitOfWork", "updateHolding", [&]() {
        auto result = txn().exec_params(
            "UPDATE investment_holdings SET shares = $2, average_cost = $3, total_invested = $4, "
            "realized_gain_loss = $5, status = $6, updated_at = NOW() WHERE id = $1 RETURNING id",
            holding.id,
            shares(holding.shares),
            money(holding.averageCost),
            money(holding.totalInvested),
            money(holding.realizedGainLoss),
            domain::toString(holding.status));
        if (result.empty()) {
            throw domain::StoreFailureException("Holding disappeared during update: " + holding.id);
        }
    });
}

void PostgresUnitOfWork::insertInvestmentTransaction(const domain::InvestmentTransaction& transaction) {
    guarded("PostgresUnitOfWork", "insertInvestmentTransaction", [&]() {
        txn().exec_params(
            "INSERT INTO investment_transactions "
            "(id, user_id, account_id, product_id, holding_id, transaction_group_id, transaction_type, "
            " shares, unit_price, gross_amount, fee, net_amount, status, description, settlement_date, created_at) "
            "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, $14, $15, $16)",
            transaction.id,
            transaction.userId,
            transaction.accountId,
            transaction.productId,
            transaction.holdingId,
            transaction.transactionGroupId,
            domain::toString(transaction.kind),
            shares(transaction.shares),
            money(transaction.unitPrice),
            money(transaction.grossAmount),
            money(transaction.fee),
            money(transaction.netAmount),
            domain::toString(transaction.status),
            transaction.description,
            transaction.settlementDate.toString(),
            transaction.createdAt.toString());
    });
}

void PostgresUnitOfWork::commit() {
    guarded("PostgresUnitOfWork", "commit", [&]() {
        txn().commit();
        txn_.reset();
        conn_.reset();
    });
}

void PostgresUnitOfWork::abort() {
    if (!txn_) {
        return;
    }
    try {
        txn_->abort();
    } catch (const std::exception& e) {
        // Соединение уже потеряно: сервер откатит транзакцию сам
        std::cerr << "[PostgresUnitOfWork] abort error: " << e.what() << std::endl;
    }
    txn_.reset();
    conn_.reset();
}

} // namespace corebank::adapters::secondary
