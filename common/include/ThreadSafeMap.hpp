#pragma once

#include <unordered_map>
#include <shared_mutex>
#include <memory>
#include <mutex>

/**
 * @file ThreadSafeMap.hpp
 * @brief Потокобезопасный словарь с shared_ptr-значениями
 * @details
 * Чтение под shared_lock, запись под unique_lock.
 * tryInsert() позволяет использовать словарь как реестр "занятых" ключей:
 * вставка удаётся только одному из конкурирующих потоков.
 */
template <typename K, typename V>
class ThreadSafeMap
{
public:
    ThreadSafeMap() = default;

    void insert(const K &key, const std::shared_ptr<V> &value)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        map_[key] = value;
    }

    /**
     * @brief Вставить значение, только если ключ отсутствует
     * @return true если вставка произошла
     */
    bool tryInsert(const K &key, const std::shared_ptr<V> &value)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return map_.emplace(key, value).second;
    }

    std::shared_ptr<V> find(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        return (it != map_.end()) ? it->second : nullptr;
    }

    bool remove(const K &key)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return map_.erase(key) > 0;
    }

    size_t size() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.size();
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<K, std::shared_ptr<V>> map_;
};
