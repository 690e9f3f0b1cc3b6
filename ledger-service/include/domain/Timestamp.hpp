#pragma once

#include <string>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <ctime>
#include <cstdint>

namespace corebank::domain {

/**
 * @brief Временная метка в ISO 8601 формате (UTC)
 */
struct Timestamp {
    std::chrono::system_clock::time_point value;

    Timestamp() : value(std::chrono::system_clock::now()) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    /**
     * @brief Создать Timestamp из ISO 8601 строки
     * @param isoString "2025-12-16T10:30:00Z" или "2025-12-16 10:30:00" (формат PostgreSQL)
     *
     * Строка трактуется как UTC. Если разбор не удался, возвращается текущее время.
     */
    static Timestamp fromString(const std::string& isoString) {
        std::tm tm = {};
        std::istringstream ss(isoString);
        if (isoString.size() > 10 && isoString[10] == ' ') {
            ss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
        } else {
            ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        }

        if (ss.fail()) {
            return Timestamp::now();
        }

        return Timestamp(std::chrono::system_clock::from_time_t(timegm(&tm)));
    }

    /**
     * @brief Создать Timestamp из даты "2025-12-16" (полночь UTC)
     */
    static Timestamp fromDate(const std::string& date) {
        return fromString(date + "T00:00:00Z");
    }

    std::string toString() const {
        auto time_t_val = std::chrono::system_clock::to_time_t(value);
        std::tm tm = *std::gmtime(&time_t_val);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }

    /**
     * @brief Только дата: "2025-12-16"
     */
    std::string toDateString() const {
        auto time_t_val = std::chrono::system_clock::to_time_t(value);
        std::tm tm = *std::gmtime(&time_t_val);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%d");
        return ss.str();
    }

    int64_t toUnixSeconds() const {
        return std::chrono::duration_cast<std::chrono::seconds>(
            value.time_since_epoch()
        ).count();
    }

    static Timestamp fromUnixSeconds(int64_t seconds) {
        return Timestamp(std::chrono::system_clock::time_point(
            std::chrono::seconds(seconds)
        ));
    }

    Timestamp addSeconds(int64_t seconds) const {
        return Timestamp(value + std::chrono::seconds(seconds));
    }

    /**
     * @brief Добавить календарные дни (срок погашения срочного продукта)
     */
    Timestamp addDays(int64_t days) const {
        return Timestamp(value + std::chrono::hours(24 * days));
    }

    // Операторы сравнения
    bool operator==(const Timestamp& other) const { return value == other.value; }
    bool operator!=(const Timestamp& other) const { return value != other.value; }
    bool operator<(const Timestamp& other) const { return value < other.value; }
    bool operator>(const Timestamp& other) const { return value > other.value; }
    bool operator<=(const Timestamp& other) const { return value <= other.value; }
    bool operator>=(const Timestamp& other) const { return value >= other.value; }
};

} // namespace corebank::domain
