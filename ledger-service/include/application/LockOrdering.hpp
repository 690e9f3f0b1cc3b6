#pragma once

#include "domain/EntryRequest.hpp"
#include <set>
#include <string>
#include <vector>

namespace corebank::application {

/**
 * @brief Глобальный порядок захвата строк счетов
 *
 * Все операции, затрагивающие несколько счетов, блокируют их в порядке
 * возрастания id (побайтовое сравнение строк) независимо от роли дебет/кредит.
 * Переводы A->B и B->A захватывают min(A,B), затем max(A,B): цикла ожидания нет.
 */
class LockOrdering {
public:
    /**
     * @brief Уникальные id счетов запроса в порядке захвата (виртуальные ноги пропускаются)
     */
    static std::vector<std::string> acquisitionOrder(const std::vector<domain::EntryRequest>& entries) {
        std::set<std::string> ids;
        for (const auto& entry : entries) {
            if (entry.accountId) {
                ids.insert(*entry.accountId);
            }
        }
        return std::vector<std::string>(ids.begin(), ids.end());
    }

    static std::vector<std::string> acquisitionOrder(const std::vector<std::string>& accountIds) {
        std::set<std::string> ids(accountIds.begin(), accountIds.end());
        return std::vector<std::string>(ids.begin(), ids.end());
    }
};

} // namespace corebank::application
