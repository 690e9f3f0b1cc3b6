#pragma once

#include <string>
#include <stdexcept>

namespace corebank::domain {

/**
 * @brief Сторона проводки
 *
 * DEBIT уменьшает баланс счёта, CREDIT увеличивает.
 */
enum class EntryType {
    DEBIT,
    CREDIT
};

inline std::string toString(EntryType type) {
    switch (type) {
        case EntryType::DEBIT:  return "debit";
        case EntryType::CREDIT: return "credit";
    }
    return "unknown";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline EntryType entryTypeFromString(const std::string& str) {
    if (str == "debit")  return EntryType::DEBIT;
    if (str == "credit") return EntryType::CREDIT;
    throw std::invalid_argument("Unknown EntryType: " + str);
}

inline EntryType opposite(EntryType type) {
    return type == EntryType::DEBIT ? EntryType::CREDIT : EntryType::DEBIT;
}

} // namespace corebank::domain
