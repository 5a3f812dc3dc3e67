#ifndef DULCE_LIBUTL_CONCURRENT_MAP
#define DULCE_LIBUTL_CONCURRENT_MAP

#include <libutl/utilities.hpp>

namespace du::utl {

    // Thread-safe hash map with idempotent insertion.
    // Values are copied out, so references never escape the lock.
    template <typename Key, typename Value, typename Hash = std::hash<Key>>
    class Concurrent_map {
        mutable std::mutex                   m_mutex;
        std::unordered_map<Key, Value, Hash> m_map;
    public:
        Concurrent_map() = default;

        [[nodiscard]] auto find(Key const& key) const -> std::optional<Value>
        {
            std::scoped_lock _(m_mutex);
            if (auto const it = m_map.find(key); it != m_map.end()) {
                return it->second;
            }
            return std::nullopt;
        }

        // Insert `value` unless `key` is already present.
        // Returns the value that is associated with `key` after the call.
        template <typename V>
        auto insert(Key const& key, V&& value) -> Value
            requires std::is_constructible_v<Value, V>
        {
            std::scoped_lock _(m_mutex);
            return m_map.try_emplace(key, std::forward<V>(value)).first->second;
        }

        // Find the value associated with `key`, or insert the one produced by `make`.
        // `make` is invoked with the lock held and must not access this map.
        template <std::invocable Make>
        auto find_or_insert(Key const& key, Make const& make) -> Value
        {
            std::scoped_lock _(m_mutex);
            if (auto const it = m_map.find(key); it != m_map.end()) {
                return it->second;
            }
            return m_map.try_emplace(key, std::invoke(make)).first->second;
        }

        [[nodiscard]] auto size() const -> std::size_t
        {
            std::scoped_lock _(m_mutex);
            return m_map.size();
        }

        void clear()
        {
            std::scoped_lock _(m_mutex);
            m_map.clear();
        }
    };

} // namespace du::utl

#endif // DULCE_LIBUTL_CONCURRENT_MAP
