#pragma once

#include <stdexcept>
#include <string>

namespace corebank::domain {

/**
 * @brief Вид ошибки ядра учёта
 *
 * Вид, а не конкретный класс, определяет реакцию вызывающего слоя:
 * повторять можно только STORE_FAILURE.
 */
enum class ErrorKind {
    NOT_FOUND,           ///< Счёт, позиция или продукт не найден (или чужой)
    VALIDATION,          ///< Некорректный ввод: сумма <= 0, лишние паи, выход за лимиты
    INSUFFICIENT_FUNDS,  ///< Операция увела бы баланс в минус
    IMBALANCED_ENTRIES,  ///< Сумма дебетов не равна сумме кредитов
    BUSINESS_RULE,       ///< Нарушено бизнес-правило (перевод самому себе, неактивная позиция)
    STORE_FAILURE        ///< Хранилище недоступно или не удалось зафиксировать транзакцию
};

/**
 * @brief Машиночитаемый код ошибки
 */
inline std::string toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NOT_FOUND:          return "not_found";
        case ErrorKind::VALIDATION:         return "validation_error";
        case ErrorKind::INSUFFICIENT_FUNDS: return "insufficient_funds";
        case ErrorKind::IMBALANCED_ENTRIES: return "imbalanced_entries";
        case ErrorKind::BUSINESS_RULE:      return "business_rule_violation";
        case ErrorKind::STORE_FAILURE:      return "store_failure";
    }
    return "unknown";
}

/**
 * @brief Можно ли безопасно повторить операцию без изменений
 */
inline bool isRetryable(ErrorKind kind) {
    return kind == ErrorKind::STORE_FAILURE;
}

/**
 * @brief Базовое исключение ядра учёта
 */
class LedgerException : public std::runtime_error {
public:
    LedgerException(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class NotFoundException : public LedgerException {
public:
    explicit NotFoundException(const std::string& message)
        : LedgerException(ErrorKind::NOT_FOUND, message) {}
};

class ValidationException : public LedgerException {
public:
    explicit ValidationException(const std::string& message)
        : LedgerException(ErrorKind::VALIDATION, message) {}
};

class InsufficientFundsException : public LedgerException {
public:
    explicit InsufficientFundsException(const std::string& message)
        : LedgerException(ErrorKind::INSUFFICIENT_FUNDS, message) {}
};

class ImbalancedEntriesException : public LedgerException {
public:
    explicit ImbalancedEntriesException(const std::string& message)
        : LedgerException(ErrorKind::IMBALANCED_ENTRIES, message) {}
};

class BusinessRuleException : public LedgerException {
public:
    explicit BusinessRuleException(const std::string& message)
        : LedgerException(ErrorKind::BUSINESS_RULE, message) {}
};

class StoreFailureException : public LedgerException {
public:
    explicit StoreFailureException(const std::string& message)
        : LedgerException(ErrorKind::STORE_FAILURE, message) {}
};

} // namespace corebank::domain
