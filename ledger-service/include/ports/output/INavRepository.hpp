#pragma once

#include "domain/NavRecord.hpp"
#include <optional>
#include <string>
#include <vector>

namespace corebank::ports::output {

/**
 * @brief История стоимости паёв
 */
class INavRepository {
public:
    virtual ~INavRepository() = default;

    /**
     * @brief Сохранить NAV; запись на ту же дату заменяется
     */
    virtual void save(const domain::NavRecord& record) = 0;

    /**
     * @brief Запись с максимальной датой
     */
    virtual std::optional<domain::NavRecord> findLatest(const std::string& productId) = 0;

    /**
     * @brief Последние записи, новые первыми
     */
    virtual std::vector<domain::NavRecord> findHistory(const std::string& productId, int limit) = 0;
};

} // namespace corebank::ports::output
