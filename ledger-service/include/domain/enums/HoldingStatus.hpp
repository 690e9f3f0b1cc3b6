#pragma once

#include <string>
#include <stdexcept>

namespace corebank::domain {

/**
 * @brief Статус инвестиционной позиции
 *
 * ACTIVE -> REDEEMED при полном погашении (терминальный).
 * MATURED выставляет внешний плановый процесс, ядро его только читает.
 */
enum class HoldingStatus {
    ACTIVE,
    MATURED,
    REDEEMED
};

inline std::string toString(HoldingStatus status) {
    switch (status) {
        case HoldingStatus::ACTIVE:   return "active";
        case HoldingStatus::MATURED:  return "matured";
        case HoldingStatus::REDEEMED: return "redeemed";
    }
    return "unknown";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline HoldingStatus holdingStatusFromString(const std::string& str) {
    if (str == "active")   return HoldingStatus::ACTIVE;
    if (str == "matured")  return HoldingStatus::MATURED;
    if (str == "redeemed") return HoldingStatus::REDEEMED;
    throw std::invalid_argument("Unknown HoldingStatus: " + str);
}

} // namespace corebank::domain
