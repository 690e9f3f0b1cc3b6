#pragma once

#include <string>
#include <stdexcept>

namespace corebank::domain {

/**
 * @brief Вид движения денег (группы проводок)
 */
enum class TransactionKind {
    DEPOSIT,
    WITHDRAWAL,
    TRANSFER,
    INVESTMENT_PURCHASE,
    INVESTMENT_REDEMPTION
};

inline std::string toString(TransactionKind kind) {
    switch (kind) {
        case TransactionKind::DEPOSIT:               return "deposit";
        case TransactionKind::WITHDRAWAL:            return "withdrawal";
        case TransactionKind::TRANSFER:              return "transfer";
        case TransactionKind::INVESTMENT_PURCHASE:   return "investment_purchase";
        case TransactionKind::INVESTMENT_REDEMPTION: return "investment_redemption";
    }
    return "unknown";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline TransactionKind transactionKindFromString(const std::string& str) {
    if (str == "deposit")               return TransactionKind::DEPOSIT;
    if (str == "withdrawal")            return TransactionKind::WITHDRAWAL;
    if (str == "transfer")              return TransactionKind::TRANSFER;
    if (str == "investment_purchase")   return TransactionKind::INVESTMENT_PURCHASE;
    if (str == "investment_redemption") return TransactionKind::INVESTMENT_REDEMPTION;
    throw std::invalid_argument("Unknown TransactionKind: " + str);
}

} // namespace corebank::domain
