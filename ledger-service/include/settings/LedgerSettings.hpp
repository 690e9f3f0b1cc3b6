#pragma once

#include "domain/Decimal.hpp"
#include "settings/Environment.hpp"
#include <stdexcept>
#include <string>

namespace corebank::settings {

/**
 * @brief Лимиты операций и выбор хранилища
 *
 * Переменные окружения:
 * - COREBANK_MIN_TRANSACTION_AMOUNT: минимальная сумма операции (0.01)
 * - COREBANK_MAX_WITHDRAWAL_AMOUNT: максимум одного снятия (10000.00)
 * - COREBANK_MAX_TRANSFER_AMOUNT: максимум одного перевода (50000.00)
 * - COREBANK_STORE: postgres | memory
 *
 * @throws std::invalid_argument при некорректном значении
 */
class LedgerSettings {
public:
    LedgerSettings() {
        minTransactionAmount_ = env::getDecimal("COREBANK_MIN_TRANSACTION_AMOUNT", "0.01");
        maxWithdrawalAmount_ = env::getDecimal("COREBANK_MAX_WITHDRAWAL_AMOUNT", "10000.00");
        maxTransferAmount_ = env::getDecimal("COREBANK_MAX_TRANSFER_AMOUNT", "50000.00");
        store_ = env::getOrDefault("COREBANK_STORE", "postgres");
        if (store_ != "postgres" && store_ != "memory") {
            throw std::invalid_argument("COREBANK_STORE must be 'postgres' or 'memory', got: " + store_);
        }
    }

    /**
     * @brief Настройки с явными лимитами (тесты, встраивание)
     */
    static LedgerSettings fromValues(
        const domain::Decimal& minTransactionAmount,
        const domain::Decimal& maxWithdrawalAmount,
        const domain::Decimal& maxTransferAmount,
        const std::string& store = "memory"
    ) {
        LedgerSettings settings;
        settings.minTransactionAmount_ = minTransactionAmount;
        settings.maxWithdrawalAmount_ = maxWithdrawalAmount;
        settings.maxTransferAmount_ = maxTransferAmount;
        settings.store_ = store;
        return settings;
    }

    domain::Decimal getMinTransactionAmount() const { return minTransactionAmount_; }
    domain::Decimal getMaxWithdrawalAmount() const { return maxWithdrawalAmount_; }
    domain::Decimal getMaxTransferAmount() const { return maxTransferAmount_; }
    std::string getStore() const { return store_; }
    bool useInMemoryStore() const { return store_ == "memory"; }

private:
    domain::Decimal minTransactionAmount_;
    domain::Decimal maxWithdrawalAmount_;
    domain::Decimal maxTransferAmount_;
    std::string store_;
};

} // namespace corebank::settings
