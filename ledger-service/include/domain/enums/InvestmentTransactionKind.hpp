#pragma once

#include <string>
#include <stdexcept>

namespace corebank::domain {

enum class InvestmentTransactionKind {
    PURCHASE,
    REDEMPTION,
    DIVIDEND,
    INTEREST
};

inline std::string toString(InvestmentTransactionKind kind) {
    switch (kind) {
        case InvestmentTransactionKind::PURCHASE:   return "purchase";
        case InvestmentTransactionKind::REDEMPTION: return "redemption";
        case InvestmentTransactionKind::DIVIDEND:   return "dividend";
        case InvestmentTransactionKind::INTEREST:   return "interest";
    }
    return "unknown";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline InvestmentTransactionKind investmentTransactionKindFromString(const std::string& str) {
    if (str == "purchase")   return InvestmentTransactionKind::PURCHASE;
    if (str == "redemption") return InvestmentTransactionKind::REDEMPTION;
    if (str == "dividend")   return InvestmentTransactionKind::DIVIDEND;
    if (str == "interest")   return InvestmentTransactionKind::INTEREST;
    throw std::invalid_argument("Unknown InvestmentTransactionKind: " + str);
}

} // namespace corebank::domain
