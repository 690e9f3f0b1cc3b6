#pragma once

#include "domain/Decimal.hpp"
#include "domain/LedgerErrors.hpp"
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace corebank::settings::env {

inline std::string getOrDefault(const char* name, const char* defaultValue) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string(defaultValue);
}

/**
 * @throws std::invalid_argument значение не целое или вне [min, max]
 */
inline int getInt(const char* name, const char* defaultValue, int min, int max) {
    std::string raw = getOrDefault(name, defaultValue);
    size_t consumed = 0;
    int value = 0;
    try {
        value = std::stoi(raw, &consumed);
    } catch (const std::logic_error&) {
        throw std::invalid_argument(std::string(name) + ": not an integer: '" + raw + "'");
    }
    if (consumed != raw.size() || value < min || value > max) {
        throw std::invalid_argument(std::string(name) + ": expected integer in [" +
            std::to_string(min) + ", " + std::to_string(max) + "], got '" + raw + "'");
    }
    return value;
}

/**
 * @throws std::invalid_argument значение не десятичное число
 */
inline domain::Decimal getDecimal(const char* name, const char* defaultValue) {
    std::string raw = getOrDefault(name, defaultValue);
    try {
        return domain::Decimal::parse(raw);
    } catch (const domain::LedgerException& e) {
        throw std::invalid_argument(std::string(name) + ": " + e.what());
    }
}

} // namespace corebank::settings::env
