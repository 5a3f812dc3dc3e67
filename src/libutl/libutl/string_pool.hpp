#ifndef DULCE_LIBUTL_STRING_POOL
#define DULCE_LIBUTL_STRING_POOL

#include <libutl/utilities.hpp>
#include <libutl/index_vector.hpp>
#include <deque>

namespace du::utl {

    struct String_id : Vector_index<String_id, std::uint32_t> {
        using Vector_index::Vector_index;
    };

    // Interns strings. Safe to use from multiple threads.
    // Views returned by `get` remain valid for the lifetime of the pool.
    class String_pool {
        using Hash = Transparent_hash<std::string_view>;
        mutable std::mutex                                                m_mutex;
        std::unordered_map<std::string, String_id, Hash, std::equal_to<>> m_map;
        std::deque<std::string>                                           m_strings;
    public:
        String_pool() = default;

        String_pool(String_pool&& other) noexcept;
        auto operator=(String_pool&& other) noexcept -> String_pool&;

        [[nodiscard]] auto make(std::string_view string) -> String_id;
        [[nodiscard]] auto find(std::string_view string) const -> std::optional<String_id>;
        [[nodiscard]] auto get(String_id id) const -> std::string_view;
        [[nodiscard]] auto size() const -> std::size_t;
    };

} // namespace du::utl

#endif // DULCE_LIBUTL_STRING_POOL
