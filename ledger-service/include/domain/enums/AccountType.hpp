#pragma once

#include <string>
#include <stdexcept>

namespace corebank::domain {

/**
 * @brief Тип банковского счёта
 */
enum class AccountType {
    CHECKING,  ///< Текущий счёт
    SAVINGS    ///< Сберегательный счёт
};

inline std::string toString(AccountType type) {
    switch (type) {
        case AccountType::CHECKING: return "checking";
        case AccountType::SAVINGS:  return "savings";
    }
    return "unknown";
}

/**
 * @brief Создать из строки
 * @throws std::invalid_argument если строка не распознана
 */
inline AccountType accountTypeFromString(const std::string& str) {
    if (str == "checking") return AccountType::CHECKING;
    if (str == "savings")  return AccountType::SAVINGS;
    throw std::invalid_argument("Unknown AccountType: " + str);
}

} // namespace corebank::domain
