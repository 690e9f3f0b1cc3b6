#pragma once

#include <unordered_map>
#include <shared_mutex>
#include <memory>
#include <mutex>
#include <vector>

/**
 * @brief Потокобезопасный реестр объектов по ключу
 *
 * Хранит shared_ptr, поэтому найденный объект остаётся живым
 * даже после удаления ключа из реестра другим потоком.
 * Используется in-memory хранилищами как реестр блокировок строк.
 */
template <typename K, typename V>
class ThreadSafeMap
{
public:
    ThreadSafeMap() = default;

    void insert(const K &key, const std::shared_ptr<V> &value)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_); // запись
        map_[key] = value;
    }

    std::shared_ptr<V> find(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_); // чтение
        auto it = map_.find(key);
        return (it != map_.end()) ? it->second : nullptr;
    }

    /**
     * @brief Найти объект или атомарно создать его конструктором по умолчанию
     *
     * Два потока, запросившие один ключ, всегда получают один и тот же объект.
     */
    std::shared_ptr<V> getOrCreate(const K &key)
    {
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = map_.find(key);
            if (it != map_.end())
            {
                return it->second;
            }
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto &slot = map_[key];
        if (!slot)
        {
            slot = std::make_shared<V>();
        }
        return slot;
    }

    bool contains(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.find(key) != map_.end();
    }

    bool remove(const K &key)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return map_.erase(key) > 0;
    }

    /**
     * @brief Удалить ключ, если объектом больше никто не владеет
     *
     * Вызывающий должен отпустить свою копию shared_ptr до вызова.
     * @return true если ключ удалён
     */
    bool removeIfUnused(const K &key)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it == map_.end() || it->second.use_count() > 1)
        {
            return false;
        }
        map_.erase(it);
        return true;
    }

    std::vector<std::shared_ptr<V>> getAll() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<std::shared_ptr<V>> result;
        result.reserve(map_.size());
        for (const auto &[key, value] : map_)
        {
            result.push_back(value);
        }
        return result;
    }

    size_t size() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.size();
    }

    void clear()
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        map_.clear();
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<K, std::shared_ptr<V>> map_;
};
