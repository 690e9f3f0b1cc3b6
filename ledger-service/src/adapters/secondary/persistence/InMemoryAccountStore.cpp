#include "adapters/secondary/persistence/InMemoryAccountStore.hpp"
#include "domain/LedgerErrors.hpp"

#include <algorithm>
#include <iostream>

namespace corebank::adapters::secondary {

namespace {

std::string accountKey(const std::string& accountId) {
    return "account:" + accountId;
}

std::string holdingKey(const std::string& holdingId) {
    return "holding:" + holdingId;
}

std::string userProductKey(const std::string& userId, const std::string& productId) {
    return "holding-key:" + userId + "/" + productId;
}

template <typename T>
std::vector<T> page(const std::vector<T>& items, int limit, int offset) {
    std::vector<T> result;
    if (offset < 0 || limit <= 0 || static_cast<size_t>(offset) >= items.size()) {
        return result;
    }
    auto begin = items.begin() + offset;
    auto available = items.size() - static_cast<size_t>(offset);
    auto end = static_cast<size_t>(limit) < available ? begin + limit : items.end();
    result.assign(begin, end);
    return result;
}

} // namespace

// ============================================
// InMemoryAccountStore
// ============================================

InMemoryAccountStore::InMemoryAccountStore() {
    std::clog << "[InMemoryAccountStore] Created" << std::endl;
}

std::unique_ptr<ports::output::IUnitOfWork> InMemoryAccountStore::beginUnitOfWork() {
    return std::make_unique<InMemoryUnitOfWork>(*this);
}

void InMemoryAccountStore::createAccount(const domain::Account& account) {
    std::unique_lock<std::shared_mutex> lock(dataMutex_);
    if (accounts_.count(account.id) > 0) {
        throw domain::BusinessRuleException("Account id already exists: " + account.id);
    }
    if (accountIdByNumber_.count(account.number) > 0) {
        throw domain::BusinessRuleException("Account number already exists: " + account.number);
    }
    accounts_[account.id] = account;
    accountOrder_.push_back(account.id);
    accountIdByNumber_[account.number] = account.id;
}

std::optional<domain::Account> InMemoryAccountStore::findAccountById(const std::string& accountId) {
    return readAccount(accountId);
}

std::optional<domain::Account> InMemoryAccountStore::findAccountByNumber(const std::string& number) {
    std::shared_lock<std::shared_mutex> lock(dataMutex_);
    auto it = accountIdByNumber_.find(number);
    if (it == accountIdByNumber_.end()) {
        return std::nullopt;
    }
    return accounts_.at(it->second);
}

std::vector<domain::Account> InMemoryAccountStore::findAccountsByOwner(const std::string& ownerId) {
    std::shared_lock<std::shared_mutex> lock(dataMutex_);
    std::vector<domain::Account> result;
    for (const auto& id : accountOrder_) {
        const auto& account = accounts_.at(id);
        if (account.ownerId == ownerId) {
            result.push_back(account);
        }
    }
    return result;
}

std::vector<domain::Account> InMemoryAccountStore::findAllAccounts() {
    std::shared_lock<std::shared_mutex> lock(dataMutex_);
    std::vector<domain::Account> result;
    result.reserve(accountOrder_.size());
    for (const auto& id : accountOrder_) {
        result.push_back(accounts_.at(id));
    }
    return result;
}

std::optional<domain::TransactionGroup> InMemoryAccountStore::findTransactionGroupById(const std::string& groupId) {
    std::shared_lock<std::shared_mutex> lock(dataMutex_);
    auto it = groupIndex_.find(groupId);
    if (it == groupIndex_.end()) {
        return std::nullopt;
    }
    return groups_[it->second];
}

std::vector<domain::TransactionGroup> InMemoryAccountStore::findAllTransactionGroups() {
    std::shared_lock<std::shared_mutex> lock(dataMutex_);
    return groups_;
}

std::vector<domain::TransactionEntry> InMemoryAccountStore::findEntriesByGroupId(const std::string& groupId) {
    std::shared_lock<std::shared_mutex> lock(dataMutex_);
    std::vector<domain::TransactionEntry> result;
    for (const auto& entry : entries_) {
        if (entry.groupId == groupId) {
            result.push_back(entry);
        }
    }
    return result;
}

std::vector<domain::TransactionEntry> InMemoryAccountStore::findEntriesByAccountId(
    const std::string& accountId, int limit, int offset) {
    std::vector<domain::TransactionEntry> matching;
    {
        std::shared_lock<std::shared_mutex> lock(dataMutex_);
        for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
            if (it->accountId == accountId) {
                matching.push_back(*it);
            }
        }
    }
    return page(matching, limit, offset);
}

int64_t InMemoryAccountStore::countEntriesByAccountId(const std::string& accountId) {
    std::shared_lock<std::shared_mutex> lock(dataMutex_);
    return std::count_if(entries_.begin(), entries_.end(), [&accountId](const domain::TransactionEntry& entry) {
        return entry.accountId == accountId;
    });
}

std::optional<domain::InvestmentHolding> InMemoryAccountStore::findHoldingById(const std::string& holdingId) {
    return readHolding(holdingId);
}

std::vector<domain::InvestmentHolding> InMemoryAccountStore::findHoldingsByUserId(const std::string& userId) {
    std::shared_lock<std::shared_mutex> lock(dataMutex_);
    std::vector<domain::InvestmentHolding> result;
    for (auto it = holdingOrder_.rbegin(); it != holdingOrder_.rend(); ++it) {
        const auto& holding = holdings_.at(*it);
        if (holding.userId == userId) {
            result.push_back(holding);
        }
    }
    return result;
}

std::vector<domain::InvestmentTransaction> InMemoryAccountStore::findInvestmentTransactionsByUserId(
    const std::string& userId,
    const std::optional<std::string>& productId,
    const std::optional<domain::InvestmentTransactionKind>& kind,
    int limit,
    int offset) {
    std::vector<domain::InvestmentTransaction> matching;
    {
        std::shared_lock<std::shared_mutex> lock(dataMutex_);
        for (auto it = investmentTransactions_.rbegin(); it != investmentTransactions_.rend(); ++it) {
            if (it->userId != userId) continue;
            if (productId && it->productId != *productId) continue;
            if (kind && it->kind != *kind) continue;
            matching.push_back(*it);
        }
    }
    return page(matching, limit, offset);
}

std::optional<domain::Account> InMemoryAccountStore::readAccount(const std::string& accountId) const {
    std::shared_lock<std::shared_mutex> lock(dataMutex_);
    auto it = accounts_.find(accountId);
    if (it == accounts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<domain::InvestmentHolding> InMemoryAccountStore::readHolding(const std::string& holdingId) const {
    std::shared_lock<std::shared_mutex> lock(dataMutex_);
    auto it = holdings_.find(holdingId);
    if (it == holdings_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> InMemoryAccountStore::findActiveHoldingId(
    const std::string& userId, const std::string& productId) const {
    std::shared_lock<std::shared_mutex> lock(dataMutex_);
    for (const auto& [id, holding] : holdings_) {
        if (holding.userId == userId && holding.productId == productId && holding.isActive()) {
            return id;
        }
    }
    return std::nullopt;
}

void InMemoryAccountStore::apply(const ChangeSet& changes) {
    int remaining = failCommits_.load();
    while (remaining > 0) {
        if (failCommits_.compare_exchange_weak(remaining, remaining - 1)) {
            throw domain::StoreFailureException("Injected commit failure");
        }
    }

    std::unique_lock<std::shared_mutex> lock(dataMutex_);

    for (const auto& account : changes.newAccounts) {
        if (accounts_.count(account.id) > 0 || accountIdByNumber_.count(account.number) > 0) {
            throw domain::BusinessRuleException("Account id or number already exists: " + account.number);
        }
    }

    // Одна активная позиция на (userId, productId)
    for (const auto& holding : changes.holdings) {
        if (!holding.isActive()) continue;
        for (const auto& [id, existing] : holdings_) {
            if (id != holding.id && existing.isActive() &&
                existing.userId == holding.userId && existing.productId == holding.productId) {
                bool replacedInSameCommit = std::any_of(
                    changes.holdings.begin(), changes.holdings.end(),
                    [&id](const domain::InvestmentHolding& h) { return h.id == id && !h.isActive(); });
                if (!replacedInSameCommit) {
                    throw domain::StoreFailureException(
                        "Duplicate active holding for user " + holding.userId + " and product " + holding.productId);
                }
            }
        }
    }

    for (const auto& account : changes.newAccounts) {
        accounts_[account.id] = account;
        accountOrder_.push_back(account.id);
        accountIdByNumber_[account.number] = account.id;
    }
    for (const auto& account : changes.accounts) {
        accounts_[account.id] = account;
    }
    for (const auto& group : changes.groups) {
        groupIndex_[group.id] = groups_.size();
        groups_.push_back(group);
    }
    entries_.insert(entries_.end(), changes.entries.begin(), changes.entries.end());
    for (const auto& holding : changes.holdings) {
        if (holdings_.count(holding.id) == 0) {
            holdingOrder_.push_back(holding.id);
        }
        holdings_[holding.id] = holding;
    }
    investmentTransactions_.insert(
        investmentTransactions_.end(),
        changes.investmentTransactions.begin(),
        changes.investmentTransactions.end());
}

// ============================================
// InMemoryUnitOfWork
// ============================================

InMemoryUnitOfWork::InMemoryUnitOfWork(InMemoryAccountStore& store) : store_(store) {}

InMemoryUnitOfWork::~InMemoryUnitOfWork() {
    if (!finished_) {
        abort();
    }
}

void InMemoryUnitOfWork::acquire(const std::string& key) {
    if (locks_.count(key) > 0) {
        return;
    }
    HeldLock held;
    held.row = store_.rowLock(key);
    held.lock = std::unique_lock<std::mutex>(held.row->mutex);
    locks_.emplace(key, std::move(held));
}

void InMemoryUnitOfWork::ensureOpen() const {
    if (finished_) {
        throw domain::StoreFailureException("Unit of work already finished");
    }
}

void InMemoryUnitOfWork::release() {
    std::vector<std::string> keys;
    keys.reserve(locks_.size());
    for (const auto& [key, held] : locks_) {
        keys.push_back(key);
    }

    // unique_lock разрушается раньше shared_ptr на мьютекс (порядок полей HeldLock)
    locks_.clear();
    for (const auto& key : keys) {
        store_.dropRowLock(key);
    }
    finished_ = true;
}

std::optional<domain::Account> InMemoryUnitOfWork::getAccountForUpdate(const std::string& accountId) {
    ensureOpen();
    auto cached = lockedAccounts_.find(accountId);
    if (cached != lockedAccounts_.end()) {
        return cached->second;
    }

    acquire(accountKey(accountId));
    auto account = store_.readAccount(accountId);
    lockedAccounts_[accountId] = account;
    return account;
}

void InMemoryUnitOfWork::insertAccount(const domain::Account& account) {
    ensureOpen();
    acquire(accountKey(account.id));

    auto staged = lockedAccounts_.find(account.id);
    if ((staged != lockedAccounts_.end() && staged->second) ||
        store_.readAccount(account.id) || store_.findAccountByNumber(account.number)) {
        throw domain::BusinessRuleException("Account id or number already exists: " + account.number);
    }

    lockedAccounts_[account.id] = account;
    dirtyAccounts_.insert(account.id);
    newAccounts_.insert(account.id);
}

bool InMemoryUnitOfWork::setBalance(const std::string& accountId, const domain::Decimal& balance) {
    ensureOpen();
    if (!getAccountForUpdate(accountId)) {
        return false;
    }
    auto& account = *lockedAccounts_[accountId];
    account.balance = balance;
    account.updatedAt = domain::Timestamp::now();
    dirtyAccounts_.insert(accountId);
    return true;
}

void InMemoryUnitOfWork::insertTransactionGroup(const domain::TransactionGroup& group) {
    ensureOpen();
    pending_.groups.push_back(group);
}

void InMemoryUnitOfWork::insertTransactionEntry(const domain::TransactionEntry& entry) {
    ensureOpen();
    pending_.entries.push_back(entry);
}

std::optional<domain::InvestmentHolding> InMemoryUnitOfWork::findActiveHoldingForUpdate(
    const std::string& userId, const std::string& productId) {
    ensureOpen();
    acquire(userProductKey(userId, productId));

    for (const auto& [id, holding] : lockedHoldings_) {
        if (holding.userId == userId && holding.productId == productId && holding.isActive()) {
            return holding;
        }
    }

    auto holdingId = store_.findActiveHoldingId(userId, productId);
    if (!holdingId) {
        return std::nullopt;
    }
    auto holding = getHoldingForUpdate(*holdingId);
    if (!holding || !holding->isActive()) {
        // Погашена между поиском и блокировкой
        return std::nullopt;
    }
    return holding;
}

std::optional<domain::InvestmentHolding> InMemoryUnitOfWork::getHoldingForUpdate(const std::string& holdingId) {
    ensureOpen();
    auto cached = lockedHoldings_.find(holdingId);
    if (cached != lockedHoldings_.end()) {
        return cached->second;
    }

    acquire(holdingKey(holdingId));
    auto holding = store_.readHolding(holdingId);
    if (holding) {
        lockedHoldings_[holdingId] = *holding;
    }
    return holding;
}

void InMemoryUnitOfWork::insertHolding(const domain::InvestmentHolding& holding) {
    ensureOpen();
    acquire(holdingKey(holding.id));
    lockedHoldings_[holding.id] = holding;
    if (dirtyHoldings_.insert(holding.id).second) {
        dirtyHoldingOrder_.push_back(holding.id);
    }
}

void InMemoryUnitOfWork::updateHolding(const domain::InvestmentHolding& holding) {
    ensureOpen();
    auto it = lockedHoldings_.find(holding.id);
    if (it == lockedHoldings_.end()) {
        throw domain::StoreFailureException("Holding is not locked by this unit of work: " + holding.id);
    }
    it->second = holding;
    it->second.updatedAt = domain::Timestamp::now();
    if (dirtyHoldings_.insert(holding.id).second) {
        dirtyHoldingOrder_.push_back(holding.id);
    }
}

void InMemoryUnitOfWork::insertInvestmentTransaction(const domain::InvestmentTransaction& transaction) {
    ensureOpen();
    pending_.investmentTransactions.push_back(transaction);
}

void InMemoryUnitOfWork::commit() {
    ensureOpen();

    for (const auto& accountId : dirtyAccounts_) {
        auto& target = newAccounts_.count(accountId) > 0 ? pending_.newAccounts : pending_.accounts;
        target.push_back(*lockedAccounts_.at(accountId));
    }
    for (const auto& holdingId : dirtyHoldingOrder_) {
        pending_.holdings.push_back(lockedHoldings_.at(holdingId));
    }

    try {
        store_.apply(pending_);
    } catch (const domain::LedgerException& e) {
        std::cerr << "[InMemoryUnitOfWork] Commit failed: " << e.what() << std::endl;
        abort();
        throw;
    }
    release();
}

void InMemoryUnitOfWork::abort() {
    if (finished_) {
        return;
    }
    pending_ = InMemoryAccountStore::ChangeSet{};
    lockedAccounts_.clear();
    dirtyAccounts_.clear();
    newAccounts_.clear();
    lockedHoldings_.clear();
    dirtyHoldings_.clear();
    dirtyHoldingOrder_.clear();
    release();
}

} // namespace corebank::adapters::secondary
