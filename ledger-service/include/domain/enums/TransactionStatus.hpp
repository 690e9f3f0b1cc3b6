#pragma once

#include <string>
#include <stdexcept>

namespace corebank::domain {

/**
 * @brief Статус группы проводок
 *
 * Ядро создаёт группы сразу в COMPLETED: группа и её проводки
 * появляются одним коммитом либо не появляются вовсе.
 */
enum class TransactionStatus {
    PENDING,
    COMPLETED,
    FAILED,
    CANCELLED
};

inline std::string toString(TransactionStatus status) {
    switch (status) {
        case TransactionStatus::PENDING:   return "pending";
        case TransactionStatus::COMPLETED: return "completed";
        case TransactionStatus::FAILED:    return "failed";
        case TransactionStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline TransactionStatus transactionStatusFromString(const std::string& str) {
    if (str == "pending")   return TransactionStatus::PENDING;
    if (str == "completed") return TransactionStatus::COMPLETED;
    if (str == "failed")    return TransactionStatus::FAILED;
    if (str == "cancelled") return TransactionStatus::CANCELLED;
    throw std::invalid_argument("Unknown TransactionStatus: " + str);
}

/**
 * @brief Группа больше не может измениться
 */
inline bool isFinalStatus(TransactionStatus status) {
    return status != TransactionStatus::PENDING;
}

} // namespace corebank::domain
