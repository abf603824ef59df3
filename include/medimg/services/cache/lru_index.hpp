/**
 * @file lru_index.hpp
 * @brief Byte-bounded LRU bookkeeping shared by the cache backends
 *
 * A doubly-linked list keeps access order (front = most recently used) and a
 * hash map gives O(1) lookup. Byte totals and the set of insertion times are
 * maintained on every mutation so statistics never require a scan.
 *
 * The index is not synchronized; the owning backend holds its own lock.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <list>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace medimg::services::cache {

/**
 * @class lru_index
 * @brief LRU ordered map with a byte bound
 *
 * @tparam Value Slot type; must expose an `inserted_at` time point member
 * @tparam Weigher Callable returning the byte weight of a Value
 *
 * @example
 * @code
 * struct slot { time_point inserted_at; std::size_t bytes; };
 * struct by_bytes { auto operator()(const slot& s) const { return s.bytes; } };
 *
 * lru_index<slot, by_bytes> index(64 * 1024);
 * auto victims = index.insert_or_assign("image:1.2.3", slot{now, 4096});
 * @endcode
 */
template <typename Value, typename Weigher>
class lru_index {
public:
    using time_point = decltype(std::declval<Value>().inserted_at);
    using evicted_list = std::vector<std::pair<std::string, Value>>;

    explicit lru_index(uint64_t max_bytes) : max_bytes_(max_bytes) {}

    // =========================================================================
    // Lookup
    // =========================================================================

    /**
     * @brief Find without changing the access order
     */
    [[nodiscard]] auto find(std::string_view key) -> Value* {
        auto it = map_.find(std::string{key});
        return it == map_.end() ? nullptr : &it->second->second;
    }

    [[nodiscard]] auto find(std::string_view key) const -> const Value* {
        auto it = map_.find(std::string{key});
        return it == map_.end() ? nullptr : &it->second->second;
    }

    /**
     * @brief Find and move to the front of the access order
     */
    [[nodiscard]] auto promote(std::string_view key) -> Value* {
        auto it = map_.find(std::string{key});
        if (it == map_.end()) {
            return nullptr;
        }
        order_.splice(order_.begin(), order_, it->second);
        return &it->second->second;
    }

    [[nodiscard]] auto contains(std::string_view key) const -> bool {
        return map_.find(std::string{key}) != map_.end();
    }

    // =========================================================================
    // Mutation
    // =========================================================================

    /**
     * @brief Whether a value of the given weight can ever be stored
     */
    [[nodiscard]] auto fits(uint64_t weight) const noexcept -> bool {
        return max_bytes_ == 0 || weight <= max_bytes_;
    }

    /**
     * @brief Insert or replace, then evict from the back until within bound
     *
     * The caller checks fits() first; an oversized value would otherwise
     * evict every other entry.
     *
     * @return The evicted entries, least recently used first
     */
    auto insert_or_assign(const std::string& key, Value value) -> evicted_list {
        if (auto it = map_.find(key); it != map_.end()) {
            detach(it->second);
            order_.erase(it->second);
            map_.erase(it);
        }

        const auto weight = static_cast<uint64_t>(weigher_(value));
        evicted_list evicted;
        while (max_bytes_ != 0 && !order_.empty() && total_bytes_ + weight > max_bytes_) {
            auto victim = std::prev(order_.end());
            detach(victim);
            map_.erase(victim->first);
            evicted.emplace_back(std::move(victim->first), std::move(victim->second));
            order_.erase(victim);
            ++evictions_;
        }

        order_.emplace_front(key, std::move(value));
        map_[key] = order_.begin();
        attach(order_.begin());
        return evicted;
    }

    /**
     * @brief Append at the least recently used end, without eviction
     *
     * Used when rebuilding from persistent storage in descending access order.
     */
    void restore(const std::string& key, Value value) {
        order_.emplace_back(key, std::move(value));
        map_[key] = std::prev(order_.end());
        attach(std::prev(order_.end()));
    }

    auto erase(std::string_view key) -> std::optional<Value> {
        auto it = map_.find(std::string{key});
        if (it == map_.end()) {
            return std::nullopt;
        }
        auto node = it->second;
        detach(node);
        Value value = std::move(node->second);
        order_.erase(node);
        map_.erase(it);
        return value;
    }

    /**
     * @brief Change the insertion time of an entry in place
     */
    auto retime(std::string_view key, time_point inserted_at) -> bool {
        auto it = map_.find(std::string{key});
        if (it == map_.end()) {
            return false;
        }
        auto& value = it->second->second;
        erase_time(value.inserted_at);
        value.inserted_at = inserted_at;
        insert_times_.insert(inserted_at);
        return true;
    }

    /**
     * @brief Remove everything
     *
     * @return The removed entries
     */
    auto clear() -> evicted_list {
        evicted_list removed;
        removed.reserve(order_.size());
        for (auto& [key, value] : order_) {
            removed.emplace_back(std::move(key), std::move(value));
        }
        order_.clear();
        map_.clear();
        insert_times_.clear();
        total_bytes_ = 0;
        return removed;
    }

    // =========================================================================
    // Inspection
    // =========================================================================

    [[nodiscard]] auto keys(std::string_view prefix) const -> std::vector<std::string> {
        std::vector<std::string> result;
        for (const auto& [key, value] : order_) {
            if (key.starts_with(prefix)) {
                result.push_back(key);
            }
        }
        return result;
    }

    /**
     * @brief Visit entries from most to least recently used
     */
    template <typename Visitor>
    void for_each(Visitor&& visit) const {
        for (const auto& [key, value] : order_) {
            visit(key, value);
        }
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return map_.size(); }
    [[nodiscard]] auto total_bytes() const noexcept -> uint64_t { return total_bytes_; }
    [[nodiscard]] auto max_bytes() const noexcept -> uint64_t { return max_bytes_; }
    [[nodiscard]] auto evictions() const noexcept -> uint64_t { return evictions_; }

    [[nodiscard]] auto oldest() const -> std::optional<time_point> {
        if (insert_times_.empty()) {
            return std::nullopt;
        }
        return *insert_times_.begin();
    }

    [[nodiscard]] auto newest() const -> std::optional<time_point> {
        if (insert_times_.empty()) {
            return std::nullopt;
        }
        return *insert_times_.rbegin();
    }

private:
    using list_type = std::list<std::pair<std::string, Value>>;
    using list_iterator = typename list_type::iterator;

    void attach(list_iterator node) {
        total_bytes_ += static_cast<uint64_t>(weigher_(node->second));
        insert_times_.insert(node->second.inserted_at);
    }

    void detach(list_iterator node) {
        total_bytes_ -= static_cast<uint64_t>(weigher_(node->second));
        erase_time(node->second.inserted_at);
    }

    void erase_time(time_point at) {
        if (auto it = insert_times_.find(at); it != insert_times_.end()) {
            insert_times_.erase(it);
        }
    }

    uint64_t max_bytes_;
    uint64_t total_bytes_{0};
    uint64_t evictions_{0};
    Weigher weigher_{};

    list_type order_;
    std::unordered_map<std::string, list_iterator> map_;
    std::multiset<time_point> insert_times_;
};

}  // namespace medimg::services::cache
