#pragma once

#include "ports/output/INavRepository.hpp"
#include <map>
#include <mutex>
#include <unordered_map>

namespace corebank::adapters::secondary {

/**
 * @brief In-memory реализация истории NAV
 *
 * Даты "YYYY-MM-DD" сравниваются как строки, это совпадает с хронологией.
 */
class InMemoryNavRepository : public ports::output::INavRepository {
public:
    void save(const domain::NavRecord& record) override {
        std::lock_guard<std::mutex> lock(mutex_);
        history_[record.productId][record.date] = record;
    }

    std::optional<domain::NavRecord> findLatest(const std::string& productId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = history_.find(productId);
        if (it == history_.end() || it->second.empty()) {
            return std::nullopt;
        }
        return it->second.rbegin()->second;
    }

    std::vector<domain::NavRecord> findHistory(const std::string& productId, int limit) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::NavRecord> result;
        auto it = history_.find(productId);
        if (it == history_.end()) {
            return result;
        }
        for (auto rit = it->second.rbegin(); rit != it->second.rend() && static_cast<int>(result.size()) < limit; ++rit) {
            result.push_back(rit->second);
        }
        return result;
    }

private:
    std::mutex mutex_;
    std::unordered_map<std::string, std::map<std::string, domain::NavRecord>> history_;
};

} // namespace corebank::adapters::secondary
