#ifndef DULCE_LIBUTL_FLATMAP
#define DULCE_LIBUTL_FLATMAP

#include <libutl/utilities.hpp>

namespace du::utl {

    // Association list with linear lookup. Preserves insertion order.
    template <typename Key, typename Value, typename Key_equal = std::equal_to<void>>
    class Flatmap {
        std::vector<std::pair<Key, Value>> m_container;
    public:
        using key_type    = Key;
        using mapped_type = Value;
        using value_type  = std::pair<Key, Value>;

        Flatmap() = default;

        // Keeps every entry, so repeated keys can be detected later.
        template <typename K, typename V>
        constexpr auto add(K&& key, V&& value) & -> mapped_type&
            requires std::constructible_from<key_type, K> && std::constructible_from<mapped_type, V>
        {
            return m_container.emplace_back(std::forward<K>(key), std::forward<V>(value)).second;
        }

        template <typename Self, typename K>
        [[nodiscard]] constexpr auto find(this Self& self, K const& key)
            -> std::conditional_t<std::is_const_v<Self>, mapped_type const, mapped_type>*
            requires std::is_invocable_r_v<bool, Key_equal&&, key_type const&, K const&>
        {
            for (auto& [k, v] : self.m_container) {
                if (std::invoke(Key_equal {}, k, key)) {
                    return std::addressof(v);
                }
            }
            return nullptr;
        }

        // Visit every value stored under `key`, in insertion order.
        template <typename K, typename F>
        constexpr void for_each_value(K const& key, F const& callback) const
            requires std::is_invocable_r_v<bool, Key_equal&&, key_type const&, K const&>
        {
            for (auto const& [k, v] : m_container) {
                if (std::invoke(Key_equal {}, k, key)) {
                    std::invoke(callback, v);
                }
            }
        }

        [[nodiscard]] constexpr auto size() const noexcept -> std::size_t
        {
            return m_container.size();
        }

        [[nodiscard]] constexpr auto empty() const noexcept -> bool
        {
            return m_container.empty();
        }

        [[nodiscard]] constexpr auto begin(this auto& self)
        {
            return self.m_container.begin();
        }

        [[nodiscard]] constexpr auto end(this auto& self)
        {
            return self.m_container.end();
        }

        [[nodiscard]] auto operator==(Flatmap const&) const -> bool = default;
    };

} // namespace du::utl

#endif // DULCE_LIBUTL_FLATMAP
