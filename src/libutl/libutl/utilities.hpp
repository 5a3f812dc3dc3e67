#ifndef DULCE_LIBUTL_UTILITIES
#define DULCE_LIBUTL_UTILITIES

// This file is intended to be used as a precompiled header across the entire project.

#include <cpputil/util.hpp>

#include <algorithm>
#include <array>
#include <cassert>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <expected>
#include <format>
#include <functional>
#include <iostream>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <print>
#include <ranges>
#include <source_location>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

// Literal operators are useless when not easily accessible, so it is best to
// make them available everywhere. There is no risk of name collision because
// the standard reserves literal operators that do not begin with an underscore.
using namespace std::literals; // NOLINT

namespace du::utl {

    template <typename T, typename... Ts>
    concept one_of = std::disjunction_v<std::is_same<T, Ts>...>;

    template <typename... Fs>
    struct Overload : Fs... {
        using Fs::operator()...;
    };

    template <typename T>
    struct Transparent_hash : std::hash<T> {
        using is_transparent = void;
        using std::hash<T>::hash;
    };

    // Mix the hash of `value` into `seed`.
    template <typename T, typename Hash = std::hash<T>>
    constexpr void hash_combine(std::size_t& seed, T const& value)
    {
        seed ^= Hash {}(value) + 0x9e3779b97f4a7c15ULL + (seed << 6U) + (seed >> 2U);
    }

    template <typename T, std::size_t n>
    [[nodiscard]] constexpr auto to_vector(T (&&array)[n]) -> std::vector<T> // NOLINT
    {
        return std::ranges::to<std::vector>(std::views::as_rvalue(array));
    }

} // namespace du::utl

#endif // DULCE_LIBUTL_UTILITIES
