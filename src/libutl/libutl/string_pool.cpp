#include <libutl/utilities.hpp>
#include <libutl/string_pool.hpp>

du::utl::String_pool::String_pool(String_pool&& other) noexcept
{
    std::scoped_lock _(other.m_mutex);
    m_map     = std::move(other.m_map);
    m_strings = std::move(other.m_strings);
}

auto du::utl::String_pool::operator=(String_pool&& other) noexcept -> String_pool&
{
    if (this != &other) {
        std::scoped_lock _(m_mutex, other.m_mutex);
        m_map     = std::move(other.m_map);
        m_strings = std::move(other.m_strings);
    }
    return *this;
}

auto du::utl::String_pool::make(std::string_view const string) -> String_id
{
    std::scoped_lock _(m_mutex);
    if (auto const it = m_map.find(string); it != m_map.end()) {
        return it->second;
    }
    String_id const id(m_strings.size());
    m_strings.emplace_back(string);
    m_map.insert_or_assign(std::string(string), id);
    return id;
}

auto du::utl::String_pool::find(std::string_view const string) const -> std::optional<String_id>
{
    std::scoped_lock _(m_mutex);
    if (auto const it = m_map.find(string); it != m_map.end()) {
        return it->second;
    }
    return std::nullopt;
}

auto du::utl::String_pool::get(String_id const id) const -> std::string_view
{
    std::scoped_lock _(m_mutex);
    return m_strings.at(id.get());
}

auto du::utl::String_pool::size() const -> std::size_t
{
    std::scoped_lock _(m_mutex);
    return m_strings.size();
}
