#pragma once

#include <string>
#include <stdexcept>

namespace corebank::domain {

enum class InvestmentTransactionStatus {
    PENDING,
    CONFIRMED,
    CANCELLED,
    FAILED
};

inline std::string toString(InvestmentTransactionStatus status) {
    switch (status) {
        case InvestmentTransactionStatus::PENDING:   return "pending";
        case InvestmentTransactionStatus::CONFIRMED: return "confirmed";
        case InvestmentTransactionStatus::CANCELLED: return "cancelled";
        case InvestmentTransactionStatus::FAILED:    return "failed";
    }
    return "unknown";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline InvestmentTransactionStatus investmentTransactionStatusFromString(const std::string& str) {
    if (str == "pending")   return InvestmentTransactionStatus::PENDING;
    if (str == "confirmed") return InvestmentTransactionStatus::CONFIRMED;
    if (str == "cancelled") return InvestmentTransactionStatus::CANCELLED;
    if (str == "failed")    return InvestmentTransactionStatus::FAILED;
    throw std::invalid_argument("Unknown InvestmentTransactionStatus: " + str);
}

} // namespace corebank::domain
